/* Copyright (c) 2024-2026 The scrub authors
 *
 * This file is part of scrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SCRUB_DLL_HH
#define SCRUB_DLL_HH

#define SCRUB_MAJOR_VERSION 1
#define SCRUB_MINOR_VERSION 0
#define SCRUB_PATCH_VERSION 0
#define SCRUB_VERSION "1.0.0"

/*
 * SCRUB_DLL_CLASS exports classes whose runtime type information must
 * cross the shared object boundary (exceptions, base classes, anything
 * tested with dynamic_cast). SCRUB_DLL exports individual methods, and
 * SCRUB_DLL_PRIVATE hides private methods of exported classes. The
 * library is built with visibility=hidden on non-Windows systems.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libscrub_EXPORTS
#  define SCRUB_DLL __declspec(dllexport)
# else
#  define SCRUB_DLL
# endif
# define SCRUB_DLL_PRIVATE
#elif defined __GNUC__
# define SCRUB_DLL __attribute__((visibility("default")))
# define SCRUB_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define SCRUB_DLL
# define SCRUB_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define SCRUB_DLL_CLASS SCRUB_DLL
#else
# define SCRUB_DLL_CLASS
#endif

#endif /* SCRUB_DLL_HH */
