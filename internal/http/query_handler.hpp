#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/core/resolver.hpp"

namespace fieldlink::http {

struct HttpReply {
  unsigned    status = 200;
  std::string body;
};

// Decodes %XX escapes and '+' as space. Malformed escapes are kept verbatim.
std::string PercentDecode(std::string_view text);

// "a=1&b=2&a=3" -> {{"a","1"},{"b","2"},{"a","3"}}; a key without '=' gets "".
core::Seeds ParseQueryString(std::string_view query);

// {"success":..,"message":..,"data":{field:[values]}} with keys in order.
std::string RenderResolution(const core::Resolution& resolution);

/*
  QueryHandler

  Transport-free request translation:

    GET /query?<field>=<value>&... -> Resolver -> JSON envelope

  Resolution failures are reported in the envelope with status 200. Only
  routing errors (unknown path, wrong method) use other statuses.
*/
class QueryHandler {
 public:
  explicit QueryHandler(std::shared_ptr<const core::Resolver> resolver);

  // `cancel` is handed to the resolver; the transport sets it when the
  // client disconnects.
  HttpReply Handle(std::string_view method, std::string_view target, core::CancelToken cancel = nullptr) const;

 private:
  std::shared_ptr<const core::Resolver> resolver_;
};

} // namespace fieldlink::http
