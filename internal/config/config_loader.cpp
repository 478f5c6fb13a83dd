#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace fieldlink::config {

using fieldlink::util::ConfigError;

namespace {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

// `path` names the offending key in error messages, e.g. relations[1].fields.
// `message` is the schema of the mapping being walked and `field` the schema
// of the node itself; either is null when the key is not in RuntimeConfig.
google::protobuf::Value ToValue(const YAML::Node&     node,
                                const std::string&     path,
                                const Descriptor*      message,
                                const FieldDescriptor* field);

std::string KeyName(const std::string& path) {
  return path.empty() ? std::string("<root>") : path;
}

// Finite and fully consumed; "inf", "nan" and "12ab" are not numbers.
bool ParseNumber(const std::string& scalar, double* number) {
  if (scalar.empty()) {
    return false;
  }
  char* end = nullptr;
  *number   = std::strtod(scalar.c_str(), &end);
  return end && *end == '\0' && std::isfinite(*number);
}

google::protobuf::Value ScalarToValue(const YAML::Node& node, const std::string& path, const FieldDescriptor* field) {
  google::protobuf::Value value;
  const std::string&      scalar = node.Scalar();
  double                  number = 0;

  if (field) {
    switch (field->cpp_type()) {
      case FieldDescriptor::CPPTYPE_STRING:
      case FieldDescriptor::CPPTYPE_ENUM:
        value.set_string_value(scalar);
        return value;
      case FieldDescriptor::CPPTYPE_BOOL:
        if (scalar != "true" && scalar != "false") {
          throw ConfigError("`" + KeyName(path) + "` must be true or false, got `" + scalar + "`");
        }
        value.set_bool_value(scalar == "true");
        return value;
      case FieldDescriptor::CPPTYPE_INT32:
      case FieldDescriptor::CPPTYPE_INT64:
      case FieldDescriptor::CPPTYPE_UINT32:
      case FieldDescriptor::CPPTYPE_UINT64:
      case FieldDescriptor::CPPTYPE_DOUBLE:
      case FieldDescriptor::CPPTYPE_FLOAT:
        if (!ParseNumber(scalar, &number)) {
          throw ConfigError("`" + KeyName(path) + "` must be a number, got `" + scalar + "`");
        }
        value.set_number_value(number);
        return value;
      case FieldDescriptor::CPPTYPE_MESSAGE:
        break;
    }
  }

  // unknown keys: best guess, the JSON parser rejects them anyway
  if (node.Tag() == "!") {
    value.set_string_value(scalar);
  } else if (scalar == "true" || scalar == "false") {
    value.set_bool_value(scalar == "true");
  } else if (ParseNumber(scalar, &number)) {
    value.set_number_value(number);
  } else {
    value.set_string_value(scalar);
  }
  return value;
}

const FieldDescriptor* FindField(const Descriptor* message, const std::string& key) {
  if (!message) {
    return nullptr;
  }
  const auto* field = message->FindFieldByName(key);
  return field ? field : message->FindFieldByCamelcaseName(key);
}

google::protobuf::Value ToValue(const YAML::Node&     node,
                                const std::string&     path,
                                const Descriptor*      message,
                                const FieldDescriptor* field) {
  google::protobuf::Value value;

  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    value = ScalarToValue(node, path, field);
  } else if (node.IsSequence()) {
    auto* list = value.mutable_list_value();
    for (std::size_t i = 0; i < node.size(); ++i) {
      *list->add_values() = ToValue(node[i], path + "[" + std::to_string(i) + "]", message, field);
    }
  } else if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      const auto  key      = entry.first.Scalar();
      const auto* child    = FindField(message, key);
      const auto* nested   = child && child->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE ? child->message_type()
                                                                                            : nullptr;
      fields[key] = ToValue(entry.second, path.empty() ? key : path + "." + key, nested, child);
    }
  } else {
    throw ConfigError("unsupported YAML node at `" + KeyName(path) + "`");
  }

  return value;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

fieldlink::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  if (!yaml.IsMap()) {
    throw ConfigError("config file `" + path + "` must contain a YAML mapping");
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(ToValue(yaml, "", fieldlink::runtime::config::RuntimeConfig::descriptor(), nullptr), &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  fieldlink::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration in `" + path + "`: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const fieldlink::runtime::config::RuntimeConfig& config) {
  if (config.listen().empty()) {
    throw ConfigError("`listen` must be set");
  }

  std::unordered_set<std::string> field_ids;
  for (const auto& field : config.fields()) {
    if (field.id().empty()) {
      throw ConfigError("field with empty id");
    }
    if (!field_ids.insert(field.id()).second) {
      throw ConfigError("duplicate field `" + field.id() + "`");
    }
  }

  std::unordered_set<std::string> relation_names;
  for (const auto& relation : config.relations()) {
    if (relation.name().empty()) {
      throw ConfigError("relation with empty name");
    }
    if (!relation_names.insert(relation.name()).second) {
      throw ConfigError("duplicate relation name `" + relation.name() + "`");
    }
    if (relation.connect().empty()) {
      throw ConfigError("relation `" + relation.name() + "` has no `connect` descriptor");
    }
    if (relation.table_name().empty()) {
      throw ConfigError("relation `" + relation.name() + "` has no `table_name`");
    }
    if (relation.fields_size() == 0) {
      throw ConfigError("relation `" + relation.name() + "` does not have any field");
    }

    std::unordered_set<std::string> seen;
    for (const auto& field : relation.fields()) {
      if (field_ids.count(field.id()) == 0) {
        throw ConfigError("undeclared field `" + field.id() + "` used in relation `" + relation.name() +
                          "`, you have to declare it in `fields`");
      }
      if (!seen.insert(field.id()).second) {
        throw ConfigError("field `" + field.id() + "` declared twice in relation `" + relation.name() + "`");
      }
      if (field.query().empty()) {
        throw ConfigError("field `" + field.id() + "` of relation `" + relation.name() + "` has an empty query");
      }
    }
  }

  if (config.resolver().max_depth() < 0) {
    throw ConfigError("`resolver.max_depth` must not be negative");
  }
}

fieldlink::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  Validate(config);
  return config;
}

} // namespace fieldlink::config
