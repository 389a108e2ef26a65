#pragma once

/**
 * @file ncf_api_router.hpp
 * @brief JSON API routing, independent of the HTTP transport
 */

#include "ncf_control.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>

namespace ncf {

struct ApiResponse {
    int            status = 200;
    nlohmann::json body;          ///< null for an empty body
};

/**
 * @brief Maps (method, path, body) to a ControlService call
 *
 *   400  ValidationError from the control plane
 *   404  unknown path, 405 known path with another method
 *   422  body is not JSON or a required field is missing/mistyped
 *   500  blocking could not be toggled
 *
 * Error bodies are {"detail": "..."}.
 */
class ApiRouter {
public:
    explicit ApiRouter(ControlService& control);

    ApiResponse handle(const std::string& method,
                       const std::string& path,
                       const std::string& body) const;

    /// Methods registered for @p path, comma separated ("" if unknown)
    std::string allowed_methods(const std::string& path) const;

    /// Strip the query string and a trailing '/'
    static std::string normalize_path(const std::string& raw);

private:
    using Handler = std::function<ApiResponse(const nlohmann::json& body)>;

    void add(const std::string& method, const std::string& path, Handler h);
    void register_routes();

    ControlService& control_;
    std::map<std::string, std::map<std::string, Handler>> routes_;
};

} // namespace ncf
