// Copyright (c) 2024-2026 The scrub authors
//
// This file is part of scrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SCRUBCRYPTOPROVIDER_HH
#define SCRUBCRYPTOPROVIDER_HH

#include <scrub/DLL.h>
#include <scrub/ScrubCryptoImpl.hh>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

// The ScrubCryptoProvider class provides a way to select which crypto implementation is used for
// hashing, encryption, key derivation, and signatures. Every call to getImpl returns a new
// instance, so callers never share crypto state.
//
// The default implementation is the one selected at build time. It can be overridden by setting
// the SCRUB_CRYPTO_PROVIDER environment variable to the name of a registered implementation
// ("openssl" or "gnutls", depending on how scrub was built), or by calling setDefaultProvider.
class ScrubCryptoProvider
{
  public:
    // Methods for getting and registering crypto implementations. These methods are not
    // thread-safe.

    // Return an instance of a crypto provider using the default implementation.
    SCRUB_DLL
    static std::shared_ptr<ScrubCryptoImpl> getImpl();

    // Return an instance of the crypto provider registered using the given name.
    SCRUB_DLL
    static std::shared_ptr<ScrubCryptoImpl> getImpl(std::string const& name);

    // Register the given type (T) as a crypto implementation. T must be derived from
    // ScrubCryptoImpl and must have a constructor that takes no arguments.
    template <typename T>
    static void
    registerImpl(std::string const& name)
    {
        registerImpl(
            name, []() { return std::shared_ptr<ScrubCryptoImpl>(std::make_shared<T>()); });
    }

    typedef std::function<std::shared_ptr<ScrubCryptoImpl>()> provider_fn;
    SCRUB_DLL
    static void registerImpl(std::string const& name, provider_fn f);

    // Set the crypto provider registered with the given name as the default crypto
    // implementation.
    SCRUB_DLL
    static void setDefaultProvider(std::string const& name);

    // Get the names of registered implementations
    SCRUB_DLL
    static std::set<std::string> getRegisteredImpls();

    // Get the name of the default crypto provider
    SCRUB_DLL
    static std::string getDefaultProvider();

  private:
    ScrubCryptoProvider();
    ~ScrubCryptoProvider() = default;
    ScrubCryptoProvider(ScrubCryptoProvider const&) = delete;
    ScrubCryptoProvider& operator=(ScrubCryptoProvider const&) = delete;

    static ScrubCryptoProvider& getInstance();

    std::shared_ptr<ScrubCryptoImpl> getImpl_internal(std::string const& name) const;
    void registerImpl_internal(std::string const& name, provider_fn f);
    void setDefaultProvider_internal(std::string const& name);

    class Members
    {
        friend class ScrubCryptoProvider;

      public:
        Members() = default;
        SCRUB_DLL
        ~Members() = default;

      private:
        Members(Members const&) = delete;
        Members& operator=(Members const&) = delete;

        std::string default_provider;
        std::map<std::string, provider_fn> providers;
    };

    std::shared_ptr<Members> m;
};

#endif // SCRUBCRYPTOPROVIDER_HH
