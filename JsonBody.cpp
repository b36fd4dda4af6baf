#include <memory>
#include <string>

#include <json/json.h>

#include "JsonBody.hpp"

//=============================================================================================
bool jsonBody::parseObject(const std::string& text, Json::Value& object, std::string& error)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value parsed;
    if (!reader->parse(text.data(), text.data() + text.length(), &parsed, &error))
    {
        return false;
    }

    if (!parsed.isObject())
    {
        error = "JSON body is not an object";
        return false;
    }

    object = parsed;
    return true;
}

//=============================================================================================
std::string jsonBody::write(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    return Json::writeString(builder, value);
}

//=============================================================================================
std::string jsonBody::getString(const Json::Value& object, const std::string& name)
{
    if (!object.isObject() || !object.isMember(name) || !object[name].isString())
    {
        return "";
    }

    return object[name].asString();
}
