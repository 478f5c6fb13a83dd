#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using fieldlink::config::ConfigLoader;
using fieldlink::util::ConfigError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fieldlink_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool ThrowsConfigError(const std::function<void()>& fn, const std::string& expected_substring) {
  try {
    fn();
  } catch (const ConfigError& e) {
    if (std::string(e.what()).find(expected_substring) == std::string::npos) {
      std::cerr << "unexpected message: " << e.what() << "\n";
      return false;
    }
    return true;
  }
  return false;
}

constexpr char kValidConfig[] = R"(listen: "127.0.0.1:3000"
fields:
  - id: user_id
    distinct: true
  - id: email
    distinct: true
  - id: country
relations:
  - name: users
    connect: "sqlite://users.db"
    table_name: users
    fields:
      - id: user_id
        query: id
      - id: email
        query: lower(email)
  - name: accounts
    connect: "sqlite://accounts.db"
    table_name: accounts
    fields:
      - id: email
        query: email
      - id: country
        query: country
resolver:
  max_depth: 4
  lookup_threads: 2
  request_timeout_ms: 1500
logging:
  level: debug
)";

void TestLoadsFieldsRelationsAndResolverSettings() {
  const auto path   = WriteYaml("valid", kValidConfig);
  const auto config = ConfigLoader::Load(path.string());

  assert(config.listen() == "127.0.0.1:3000");
  assert(config.fields_size() == 3);
  assert(config.fields(0).id() == "user_id");
  assert(config.fields(0).distinct());
  assert(!config.fields(2).distinct());

  assert(config.relations_size() == 2);
  assert(config.relations(0).name() == "users");
  assert(config.relations(0).connect() == "sqlite://users.db");
  assert(config.relations(0).table_name() == "users");
  assert(config.relations(0).fields(1).query() == "lower(email)");

  assert(config.resolver().max_depth() == 4);
  assert(config.resolver().lookup_threads() == 2);
  assert(config.resolver().request_timeout_ms() == 1500);
  assert(config.logging().level() == "debug");
}

void TestQuotedNumericScalarStaysString() {
  const auto path = WriteYaml("quoted_numeric", R"(listen: "0.0.0.0:8080"
fields:
  - id: "42"
relations:
  - name: numbers
    connect: "numbers.db"
    table_name: t
    fields:
      - id: "42"
        query: "1"
)");

  const auto config = ConfigLoader::Load(path.string());
  assert(config.fields(0).id() == "42");
  assert(config.relations(0).fields(0).query() == "1");
}

void TestUnquotedScalarsInStringFieldsStayStrings() {
  const auto path = WriteYaml("unquoted_strings", R"(listen: localhost:8080
fields:
  - id: 2024
  - id: Infinity
  - id: 1e3
relations:
  - name: 7
    connect: memory
    table_name: 1
    fields:
      - id: 2024
        query: 0x10
logging:
  level: true
)");

  const auto config = ConfigLoader::Load(path.string());
  assert(config.fields(0).id() == "2024");
  assert(config.fields(1).id() == "Infinity");
  assert(config.fields(2).id() == "1e3");
  assert(config.relations(0).name() == "7");
  assert(config.relations(0).table_name() == "1");
  assert(config.relations(0).fields(0).id() == "2024");
  assert(config.relations(0).fields(0).query() == "0x10");
  assert(config.logging().level() == "true");
}

void TestNonNumericSettingNamesTheKey() {
  const auto bad_depth = WriteYaml("bad_depth", R"(listen: "0.0.0.0:8080"
resolver:
  max_depth: abc
)");
  assert(ThrowsConfigError([&] { ConfigLoader::LoadFromYaml(bad_depth.string()); },
                           "`resolver.max_depth` must be a number, got `abc`"));

  const auto infinite_timeout = WriteYaml("infinite_timeout", R"(listen: "0.0.0.0:8080"
resolver:
  request_timeout_ms: .inf
)");
  assert(ThrowsConfigError([&] { ConfigLoader::LoadFromYaml(infinite_timeout.string()); },
                           "`resolver.request_timeout_ms` must be a number"));

  const auto bad_distinct = WriteYaml("bad_distinct", R"(listen: "0.0.0.0:8080"
fields:
  - id: a
    distinct: yes
)");
  assert(ThrowsConfigError([&] { ConfigLoader::LoadFromYaml(bad_distinct.string()); },
                           "`fields[0].distinct` must be true or false, got `yes`"));
}

void TestUnknownKeysAreRejected() {
  const auto path = WriteYaml("unknown_key", R"(listen: "0.0.0.0:8080"
fields: []
relations: []
unknown_field: 123
)");

  assert(ThrowsConfigError([&] { ConfigLoader::LoadFromYaml(path.string()); }, "Invalid configuration"));
}

void TestMissingFileIsConfigError() {
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYaml("/nonexistent/fieldlink/config.yaml"); },
                           "Failed to load YAML config"));
}

void TestNonMappingDocumentIsRejected() {
  const auto path = WriteYaml("sequence_root", "- listen\n- fields\n");
  assert(ThrowsConfigError([&] { ConfigLoader::LoadFromYaml(path.string()); }, "must contain a YAML mapping"));
}

void TestUndeclaredRelationFieldIsRejected() {
  const auto path = WriteYaml("undeclared", R"(listen: "0.0.0.0:8080"
fields:
  - id: user_id
relations:
  - name: users
    connect: "users.db"
    table_name: users
    fields:
      - id: user_id
        query: id
      - id: phone
        query: phone
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); },
                           "undeclared field `phone` used in relation `users`"));
}

void TestDuplicateFieldIsRejected() {
  const auto path = WriteYaml("duplicate_field", R"(listen: "0.0.0.0:8080"
fields:
  - id: email
  - id: email
relations: []
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); }, "duplicate field `email`"));
}

void TestDuplicateRelationIsRejected() {
  const auto path = WriteYaml("duplicate_relation", R"(listen: "0.0.0.0:8080"
fields:
  - id: email
relations:
  - name: r
    connect: "a.db"
    table_name: t
    fields:
      - id: email
        query: email
  - name: r
    connect: "b.db"
    table_name: t
    fields:
      - id: email
        query: email
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); }, "duplicate relation name `r`"));
}

void TestRelationWithoutFieldsIsRejected() {
  const auto path = WriteYaml("no_fields", R"(listen: "0.0.0.0:8080"
fields:
  - id: email
relations:
  - name: empty
    connect: "a.db"
    table_name: t
    fields: []
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); }, "does not have any field"));
}

void TestMissingListenIsRejected() {
  const auto path = WriteYaml("no_listen", R"(fields: []
relations: []
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); }, "`listen` must be set"));
}

void TestNegativeDepthIsRejected() {
  const auto path = WriteYaml("negative_depth", R"(listen: "0.0.0.0:8080"
fields: []
relations: []
resolver:
  max_depth: -1
)");

  assert(ThrowsConfigError([&] { ConfigLoader::Load(path.string()); }, "max_depth"));
}

} // namespace

int main() {
  TestLoadsFieldsRelationsAndResolverSettings();
  TestQuotedNumericScalarStaysString();
  TestUnquotedScalarsInStringFieldsStayStrings();
  TestNonNumericSettingNamesTheKey();
  TestUnknownKeysAreRejected();
  TestMissingFileIsConfigError();
  TestNonMappingDocumentIsRejected();
  TestUndeclaredRelationFieldIsRejected();
  TestDuplicateFieldIsRejected();
  TestDuplicateRelationIsRejected();
  TestRelationWithoutFieldsIsRejected();
  TestMissingListenIsRejected();
  TestNegativeDepthIsRejected();

  std::cout << "fieldlink_unit_config_loader: pass\n";
  return 0;
}
