#if !defined JSON_BODY_HPP
#define JSON_BODY_HPP

#include <string>

#include <json/json.h>

// JSON encoding of relay message bodies
namespace jsonBody
{
    // Parses text, which must hold a single JSON object
    bool parseObject(const std::string& text, Json::Value& object, std::string& error);

    // Compact single-line encoding
    std::string write(const Json::Value& value);

    // Returns the named member if it is a string, otherwise an empty string
    std::string getString(const Json::Value& object, const std::string& name);
}

#endif
