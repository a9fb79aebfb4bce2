#include <scrub/ScrubObject.hh>

#include <scrub/ScrubUtil.hh>
#include <cstdio>
#include <stdexcept>

namespace
{
    std::string
    unparse_real(double value)
    {
        char buf[64];
        snprintf(buf, sizeof(buf), "%.6f", value);
        std::string result(buf);
        if (result.find('.') != std::string::npos) {
            while (!result.empty() && result.back() == '0') {
                result.pop_back();
            }
            if (!result.empty() && result.back() == '.') {
                result.pop_back();
            }
        }
        if (result == "-0") {
            result = "0";
        }
        return result;
    }

    std::string
    unparse_string(std::string const& value)
    {
        bool printable = true;
        for (auto ch: value) {
            auto uch = static_cast<unsigned char>(ch);
            if (uch < 0x20 || uch > 0x7e) {
                printable = false;
                break;
            }
        }
        if (!printable) {
            return "<" + ScrubUtil::hex_encode(value) + ">";
        }
        std::string result = "(";
        for (auto ch: value) {
            if (ch == '(' || ch == ')' || ch == '\\') {
                result += '\\';
            }
            result += ch;
        }
        result += ")";
        return result;
    }

    std::string
    unparse_dict(ScrubObject::dict_t const& dict)
    {
        std::string result = "<< ";
        for (auto const& iter: dict) {
            result += iter.first + " " + iter.second.unparse() + " ";
        }
        result += ">>";
        return result;
    }

    ScrubObject const null_object;
} // namespace

ScrubObject::ScrubObject() = default;

ScrubObject
ScrubObject::newNull()
{
    return {};
}

ScrubObject
ScrubObject::newBool(bool value)
{
    ScrubObject result;
    result.type = ot_boolean;
    result.bool_value = value;
    return result;
}

ScrubObject
ScrubObject::newInteger(long long value)
{
    ScrubObject result;
    result.type = ot_integer;
    result.int_value = value;
    return result;
}

ScrubObject
ScrubObject::newReal(double value)
{
    ScrubObject result;
    result.type = ot_real;
    result.real_value = value;
    return result;
}

ScrubObject
ScrubObject::newName(std::string const& name)
{
    if (name.empty() || name.at(0) != '/') {
        throw std::logic_error("ScrubObject::newName: name must start with /: " + name);
    }
    ScrubObject result;
    result.type = ot_name;
    result.str = name;
    return result;
}

ScrubObject
ScrubObject::newString(std::string const& str)
{
    ScrubObject result;
    result.type = ot_string;
    result.str = str;
    return result;
}

ScrubObject
ScrubObject::newArray(array_t const& items)
{
    ScrubObject result;
    result.type = ot_array;
    result.items = items;
    return result;
}

ScrubObject
ScrubObject::newDictionary(dict_t const& items)
{
    ScrubObject result;
    result.type = ot_dictionary;
    result.dict = items;
    return result;
}

ScrubObject
ScrubObject::newStream(dict_t const& dict, std::string const& data)
{
    ScrubObject result;
    result.type = ot_stream;
    result.dict = dict;
    result.str = data;
    return result;
}

ScrubObject
ScrubObject::newReference(ScrubObjGen og)
{
    if (!og.isIndirect()) {
        throw std::logic_error("ScrubObject::newReference called with the null object id");
    }
    ScrubObject result;
    result.type = ot_reference;
    result.ref = og;
    return result;
}

scrub_object_type_e
ScrubObject::getTypeCode() const
{
    return type;
}

char const*
ScrubObject::getTypeName() const
{
    switch (type) {
    case ot_null:
        return "null";
    case ot_boolean:
        return "boolean";
    case ot_integer:
        return "integer";
    case ot_real:
        return "real";
    case ot_string:
        return "string";
    case ot_name:
        return "name";
    case ot_array:
        return "array";
    case ot_dictionary:
        return "dictionary";
    case ot_stream:
        return "stream";
    case ot_reference:
        return "reference";
    }
    return "unknown";
}

bool
ScrubObject::isNull() const
{
    return type == ot_null;
}

bool
ScrubObject::isBool() const
{
    return type == ot_boolean;
}

bool
ScrubObject::isInteger() const
{
    return type == ot_integer;
}

bool
ScrubObject::isReal() const
{
    return type == ot_real;
}

bool
ScrubObject::isNumber() const
{
    return type == ot_integer || type == ot_real;
}

bool
ScrubObject::isName() const
{
    return type == ot_name;
}

bool
ScrubObject::isString() const
{
    return type == ot_string;
}

bool
ScrubObject::isArray() const
{
    return type == ot_array;
}

bool
ScrubObject::isDictionary() const
{
    return type == ot_dictionary;
}

bool
ScrubObject::isStream() const
{
    return type == ot_stream;
}

bool
ScrubObject::isReference() const
{
    return type == ot_reference;
}

bool
ScrubObject::hasDictionary() const
{
    return type == ot_dictionary || type == ot_stream;
}

bool
ScrubObject::isNameAndEquals(std::string const& name) const
{
    return type == ot_name && str == name;
}

bool
ScrubObject::isDictionaryOfType(std::string const& type_name, std::string const& subtype) const
{
    if (!hasDictionary()) {
        return false;
    }
    if (!getKey("/Type").isNameAndEquals(type_name)) {
        return false;
    }
    return subtype.empty() || getKey("/Subtype").isNameAndEquals(subtype);
}

void
ScrubObject::typeCheck(bool ok, char const* operation) const
{
    if (!ok) {
        throw std::logic_error(
            std::string("ScrubObject: ") + operation + " attempted on object of type " +
            getTypeName());
    }
}

bool
ScrubObject::getBoolValue() const
{
    typeCheck(type == ot_boolean, "getBoolValue");
    return bool_value;
}

long long
ScrubObject::getIntValue() const
{
    typeCheck(type == ot_integer, "getIntValue");
    return int_value;
}

double
ScrubObject::getNumericValue() const
{
    typeCheck(isNumber(), "getNumericValue");
    return type == ot_integer ? static_cast<double>(int_value) : real_value;
}

std::string const&
ScrubObject::getName() const
{
    typeCheck(type == ot_name, "getName");
    return str;
}

std::string const&
ScrubObject::getStringValue() const
{
    typeCheck(type == ot_string, "getStringValue");
    return str;
}

ScrubObjGen
ScrubObject::getRef() const
{
    typeCheck(type == ot_reference, "getRef");
    return ref;
}

int
ScrubObject::getArrayNItems() const
{
    typeCheck(type == ot_array, "getArrayNItems");
    return static_cast<int>(items.size());
}

ScrubObject const&
ScrubObject::getArrayItem(int n) const
{
    typeCheck(type == ot_array, "getArrayItem");
    if (n < 0 || static_cast<size_t>(n) >= items.size()) {
        return null_object;
    }
    return items.at(static_cast<size_t>(n));
}

ScrubObject::array_t&
ScrubObject::getArrayItems()
{
    typeCheck(type == ot_array, "getArrayItems");
    return items;
}

ScrubObject::array_t const&
ScrubObject::getArrayItems() const
{
    typeCheck(type == ot_array, "getArrayItems");
    return items;
}

void
ScrubObject::setArrayItem(int n, ScrubObject const& item)
{
    typeCheck(type == ot_array, "setArrayItem");
    if (n < 0 || static_cast<size_t>(n) >= items.size()) {
        throw std::logic_error("ScrubObject::setArrayItem: index out of range");
    }
    items.at(static_cast<size_t>(n)) = item;
}

void
ScrubObject::appendItem(ScrubObject const& item)
{
    typeCheck(type == ot_array, "appendItem");
    items.push_back(item);
}

void
ScrubObject::eraseItem(int n)
{
    typeCheck(type == ot_array, "eraseItem");
    if (n < 0 || static_cast<size_t>(n) >= items.size()) {
        throw std::logic_error("ScrubObject::eraseItem: index out of range");
    }
    items.erase(items.begin() + n);
}

bool
ScrubObject::hasKey(std::string const& key) const
{
    typeCheck(hasDictionary(), "hasKey");
    return dict.count(key) > 0;
}

ScrubObject const&
ScrubObject::getKey(std::string const& key) const
{
    typeCheck(hasDictionary(), "getKey");
    auto iter = dict.find(key);
    if (iter == dict.end()) {
        return null_object;
    }
    return iter->second;
}

std::set<std::string>
ScrubObject::getKeys() const
{
    typeCheck(hasDictionary(), "getKeys");
    std::set<std::string> result;
    for (auto const& iter: dict) {
        result.insert(iter.first);
    }
    return result;
}

void
ScrubObject::replaceKey(std::string const& key, ScrubObject const& value)
{
    typeCheck(hasDictionary(), "replaceKey");
    dict[key] = value;
}

void
ScrubObject::removeKey(std::string const& key)
{
    typeCheck(hasDictionary(), "removeKey");
    dict.erase(key);
}

ScrubObject::dict_t&
ScrubObject::getDictAsMap()
{
    typeCheck(hasDictionary(), "getDictAsMap");
    return dict;
}

ScrubObject::dict_t const&
ScrubObject::getDictAsMap() const
{
    typeCheck(hasDictionary(), "getDictAsMap");
    return dict;
}

std::string const&
ScrubObject::getStreamData() const
{
    typeCheck(type == ot_stream, "getStreamData");
    return str;
}

void
ScrubObject::replaceStreamData(std::string const& data)
{
    typeCheck(type == ot_stream, "replaceStreamData");
    str = data;
    dict["/Length"] = newInteger(static_cast<long long>(data.size()));
}

std::string
ScrubObject::unparse() const
{
    switch (type) {
    case ot_null:
        return "null";
    case ot_boolean:
        return bool_value ? "true" : "false";
    case ot_integer:
        return std::to_string(int_value);
    case ot_real:
        return unparse_real(real_value);
    case ot_string:
        return unparse_string(str);
    case ot_name:
        return str;
    case ot_array:
        {
            std::string result = "[ ";
            for (auto const& item: items) {
                result += item.unparse() + " ";
            }
            result += "]";
            return result;
        }
    case ot_dictionary:
        return unparse_dict(dict);
    case ot_stream:
        return unparse_dict(dict) + " stream";
    case ot_reference:
        return ref.describe();
    }
    return "null";
}

size_t
ScrubObject::getSerializedSize() const
{
    size_t result = unparse().size();
    if (type == ot_stream) {
        // "\n" + data + "\nendstream"
        result += str.size() + 11;
    }
    return result;
}

bool
ScrubObject::operator==(ScrubObject const& rhs) const
{
    if (type != rhs.type) {
        return false;
    }
    switch (type) {
    case ot_null:
        return true;
    case ot_boolean:
        return bool_value == rhs.bool_value;
    case ot_integer:
        return int_value == rhs.int_value;
    case ot_real:
        return real_value == rhs.real_value;
    case ot_string:
    case ot_name:
        return str == rhs.str;
    case ot_array:
        return items == rhs.items;
    case ot_dictionary:
        return dict == rhs.dict;
    case ot_stream:
        return dict == rhs.dict && str == rhs.str;
    case ot_reference:
        return ref == rhs.ref;
    }
    return false;
}

bool
ScrubObject::operator!=(ScrubObject const& rhs) const
{
    return !(*this == rhs);
}
