// Copyright 2026 visitor_badge contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "visitor_badge/http/handlers/handler_context.hpp"

#include "visitor_badge/http/http_utils.hpp"

using json = nlohmann::json;

namespace visitor_badge {
namespace handlers {

void HandlerContext::send_text(httplib::Response & res, httplib::StatusCode status, const std::string & body) {
  res.status = status;
  res.set_content(body, TEXT_CONTENT_TYPE);
}

void HandlerContext::send_json(httplib::Response & res, const json & data) {
  res.status = httplib::StatusCode::OK_200;
  res.set_content(data.dump(2), JSON_CONTENT_TYPE);
}

}  // namespace handlers
}  // namespace visitor_badge
