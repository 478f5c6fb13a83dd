#include "internal/http/query_handler.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

#include <stdexcept>
#include <utility>

#include "fieldlink/v1/resolve.pb.h"
#include "internal/observability/logging.hpp"

namespace fieldlink::http {

namespace {

constexpr char kTypeUrlPrefix[] = "type.googleapis.com";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

HttpReply Failure(unsigned status, const std::string& message) {
  core::Resolution resolution;
  resolution.success = false;
  resolution.message = message;
  return {status, RenderResolution(resolution)};
}

} // namespace

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      out.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < text.size()) {
      const int hi = HexValue(text[i + 1]);
      const int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

core::Seeds ParseQueryString(std::string_view query) {
  core::Seeds seeds;
  while (!query.empty()) {
    const auto amp  = query.find('&');
    const auto pair = query.substr(0, amp);
    query           = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

    if (pair.empty()) {
      continue;
    }

    const auto eq = pair.find('=');
    auto       key = PercentDecode(pair.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    std::string value = eq == std::string_view::npos ? std::string{} : PercentDecode(pair.substr(eq + 1));
    seeds.emplace_back(std::move(key), std::move(value));
  }
  return seeds;
}

std::string RenderResolution(const core::Resolution& resolution) {
  fieldlink::v1::ResolveResponse response;
  response.set_success(resolution.success);
  response.set_message(resolution.message);
  for (const auto& [field, values] : resolution.data) {
    auto& list = (*response.mutable_data())[field];
    for (const auto& value : values) {
      list.add_values()->set_string_value(value);
    }
  }

  // deterministic serialization orders map entries by key
  std::string binary;
  {
    google::protobuf::io::StringOutputStream raw(&binary);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!response.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("failed to serialize ResolveResponse");
    }
  }

  static const std::unique_ptr<google::protobuf::util::TypeResolver> type_resolver(
      google::protobuf::util::NewTypeResolverForDescriptorPool(kTypeUrlPrefix,
                                                               google::protobuf::DescriptorPool::generated_pool()));

  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto status = google::protobuf::util::BinaryToJsonString(
      type_resolver.get(), std::string(kTypeUrlPrefix) + "/" + response.GetDescriptor()->full_name(), binary, &json,
      options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render ResolveResponse: " + std::string(status.message()));
  }
  return json;
}

QueryHandler::QueryHandler(std::shared_ptr<const core::Resolver> resolver) : resolver_(std::move(resolver)) {
}

HttpReply QueryHandler::Handle(std::string_view method, std::string_view target, core::CancelToken cancel) const {
  const auto question = target.find('?');
  const auto path     = target.substr(0, question);
  const auto query    = question == std::string_view::npos ? std::string_view{} : target.substr(question + 1);

  if (path != "/query") {
    return Failure(404, "no route for `" + std::string(path) + "`");
  }
  if (method != "GET") {
    return Failure(405, "method `" + std::string(method) + "` not allowed");
  }

  const auto seeds = ParseQueryString(query);
  FIELDLINK_LOG_DEBUG("Query", {observability::StringField("target", target),
                                observability::IntField("seeds", static_cast<std::int64_t>(seeds.size()))});

  return {200, RenderResolution(resolver_->Resolve(seeds, std::move(cancel)))};
}

} // namespace fieldlink::http
