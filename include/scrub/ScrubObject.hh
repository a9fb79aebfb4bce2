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

#ifndef SCRUBOBJECT_HH
#define SCRUBOBJECT_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>
#include <scrub/ScrubObjGen.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

// ScrubObject is a value-semantic representation of one node of a document's object graph. It is
// one of null, boolean, integer, real, string, name, array, dictionary, stream, or a reference
// to an indirect object owned by a ScrubDocument. Copying a ScrubObject copies the whole
// subtree; indirect objects are only shared through references.
//
// Names are stored with their leading slash, e.g. "/Type". Dictionary keys are names as well.
// Dictionary accessors also operate on the dictionary of a stream.
//
// Calling an accessor on an object of the wrong type throws std::logic_error. Use the is*
// methods to check first.
class ScrubObject
{
  public:
    typedef std::map<std::string, ScrubObject> dict_t;
    typedef std::vector<ScrubObject> array_t;

    // The default constructor creates a null object.
    SCRUB_DLL
    ScrubObject();

    SCRUB_DLL
    static ScrubObject newNull();
    SCRUB_DLL
    static ScrubObject newBool(bool value);
    SCRUB_DLL
    static ScrubObject newInteger(long long value);
    SCRUB_DLL
    static ScrubObject newReal(double value);
    SCRUB_DLL
    static ScrubObject newName(std::string const& name);
    SCRUB_DLL
    static ScrubObject newString(std::string const& str);
    SCRUB_DLL
    static ScrubObject newArray(array_t const& items = array_t());
    SCRUB_DLL
    static ScrubObject newDictionary(dict_t const& items = dict_t());
    SCRUB_DLL
    static ScrubObject newStream(dict_t const& dict = dict_t(), std::string const& data = "");
    SCRUB_DLL
    static ScrubObject newReference(ScrubObjGen og);

    SCRUB_DLL
    scrub_object_type_e getTypeCode() const;
    SCRUB_DLL
    char const* getTypeName() const;

    SCRUB_DLL
    bool isNull() const;
    SCRUB_DLL
    bool isBool() const;
    SCRUB_DLL
    bool isInteger() const;
    SCRUB_DLL
    bool isReal() const;
    SCRUB_DLL
    bool isNumber() const;
    SCRUB_DLL
    bool isName() const;
    SCRUB_DLL
    bool isString() const;
    SCRUB_DLL
    bool isArray() const;
    SCRUB_DLL
    bool isDictionary() const;
    SCRUB_DLL
    bool isStream() const;
    SCRUB_DLL
    bool isReference() const;
    // True for dictionaries and streams
    SCRUB_DLL
    bool hasDictionary() const;

    SCRUB_DLL
    bool isNameAndEquals(std::string const& name) const;
    // True if this is a dictionary or stream whose /Type is type and, if subtype is not empty,
    // whose /Subtype is subtype.
    SCRUB_DLL
    bool isDictionaryOfType(std::string const& type, std::string const& subtype = "") const;

    // Scalar accessors
    SCRUB_DLL
    bool getBoolValue() const;
    SCRUB_DLL
    long long getIntValue() const;
    // Integer or real as a double
    SCRUB_DLL
    double getNumericValue() const;
    SCRUB_DLL
    std::string const& getName() const;
    SCRUB_DLL
    std::string const& getStringValue() const;
    SCRUB_DLL
    ScrubObjGen getRef() const;

    // Array accessors
    SCRUB_DLL
    int getArrayNItems() const;
    SCRUB_DLL
    ScrubObject const& getArrayItem(int n) const;
    SCRUB_DLL
    array_t& getArrayItems();
    SCRUB_DLL
    array_t const& getArrayItems() const;
    SCRUB_DLL
    void setArrayItem(int n, ScrubObject const& item);
    SCRUB_DLL
    void appendItem(ScrubObject const& item);
    SCRUB_DLL
    void eraseItem(int n);

    // Dictionary accessors. getKey returns a null object if the key is absent.
    SCRUB_DLL
    bool hasKey(std::string const& key) const;
    SCRUB_DLL
    ScrubObject const& getKey(std::string const& key) const;
    SCRUB_DLL
    std::set<std::string> getKeys() const;
    SCRUB_DLL
    void replaceKey(std::string const& key, ScrubObject const& value);
    SCRUB_DLL
    void removeKey(std::string const& key);
    SCRUB_DLL
    dict_t& getDictAsMap();
    SCRUB_DLL
    dict_t const& getDictAsMap() const;

    // Stream accessors
    SCRUB_DLL
    std::string const& getStreamData() const;
    SCRUB_DLL
    void replaceStreamData(std::string const& data);

    // Return a textual representation in document syntax. Dictionary keys appear in sorted
    // order. A stream unparses as its dictionary followed by the keyword "stream"; its data is
    // not included.
    SCRUB_DLL
    std::string unparse() const;

    // Approximate number of bytes this object occupies when written, including stream data
    SCRUB_DLL
    size_t getSerializedSize() const;

    SCRUB_DLL
    bool operator==(ScrubObject const& rhs) const;
    SCRUB_DLL
    bool operator!=(ScrubObject const& rhs) const;

  private:
    void typeCheck(bool ok, char const* operation) const;

    // This class does not use the Members pattern. Objects are values and are copied
    // frequently.
    scrub_object_type_e type{ot_null};
    bool bool_value{false};
    long long int_value{0};
    double real_value{0.0};
    // name, string, or stream data
    std::string str;
    array_t items;
    dict_t dict;
    ScrubObjGen ref;
};

#endif // SCRUBOBJECT_HH
