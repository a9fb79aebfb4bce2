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

#ifndef SCRUBOBJGEN_HH
#define SCRUBOBJGEN_HH

#include <scrub/DLL.h>

#include <cstddef>
#include <functional>
#include <iostream>
#include <set>
#include <string>

// This class represents an object ID and generation pair. It is used to identify indirect objects
// in a ScrubDocument. ScrubObjGen(0, 0) is the null id and never names a real object.
class ScrubObjGen
{
  public:
    ScrubObjGen() = default;
    ScrubObjGen(int obj, int gen) :
        obj(obj),
        gen(gen)
    {
    }
    bool
    operator<(ScrubObjGen const& rhs) const
    {
        return (obj < rhs.obj) || (obj == rhs.obj && gen < rhs.gen);
    }
    bool
    operator==(ScrubObjGen const& rhs) const
    {
        return obj == rhs.obj && gen == rhs.gen;
    }
    bool
    operator!=(ScrubObjGen const& rhs) const
    {
        return !(*this == rhs);
    }
    int
    getObj() const
    {
        return obj;
    }
    int
    getGen() const
    {
        return gen;
    }
    bool
    isIndirect() const
    {
        return obj != 0;
    }
    std::string
    unparse(char separator = ',') const
    {
        return std::to_string(obj) + separator + std::to_string(gen);
    }
    // "7 0 R", the form used in messages and exception texts
    std::string
    describe() const
    {
        return std::to_string(obj) + " " + std::to_string(gen) + " R";
    }
    friend std::ostream&
    operator<<(std::ostream& os, ScrubObjGen og)
    {
        os << og.obj << "," << og.gen;
        return os;
    }

    // Convenience class for loop detection when walking object graphs. add() returns false if
    // 'og' is already present in the set. Attempts to insert ScrubObjGen(0, 0) are ignored.
    class SCRUB_DLL_CLASS set: public std::set<ScrubObjGen>
    {
      public:
        bool
        add(ScrubObjGen og)
        {
            if (og.isIndirect()) {
                if (count(og)) {
                    return false;
                }
                emplace(og);
            }
            return true;
        }

        void
        erase(ScrubObjGen og)
        {
            if (og.isIndirect()) {
                std::set<ScrubObjGen>::erase(og);
            }
        }
    };

  private:
    // This class does not use the Members pattern to avoid a memory allocation for every one of
    // these. A lot of these get created and destroyed.
    int obj{0};
    int gen{0};
};

namespace std
{
    template <>
    struct hash<ScrubObjGen>
    {
        size_t
        operator()(ScrubObjGen const& og) const noexcept
        {
            return std::hash<long long>()(
                (static_cast<long long>(og.getObj()) << 16) ^ static_cast<long long>(og.getGen()));
        }
    };
} // namespace std

#endif // SCRUBOBJGEN_HH
