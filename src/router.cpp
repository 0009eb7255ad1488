#include "stillhere/http.hpp"
#include "stillhere/identity.hpp"
#include "stillhere/json.hpp"
#include "stillhere/logger.hpp"

#include <vector>

namespace stillhere {
namespace http {

namespace {

Response json_response(int status, const json::json& body) { return {status, body.dump()}; }

Response error_response(int status, const std::string& details) {
    return json_response(status, json::build_error_response(details));
}

// "/a/b/" -> {"a", "b"}
std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string::size_type pos = 0;
    while (pos < path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

}  // namespace

Response Router::handle(const Request& request) const {
    try {
        auto segments = split_path(request.path);

        if (segments.size() == 2 && segments[0] == "api" && segments[1] == "health") {
            if (request.method != Method::GET) {
                return error_response(405, "Method Not Allowed");
            }
            return health();
        }

        if (segments.size() < 2 || segments[0] != "api" || segments[1] != "device") {
            return error_response(404, "Not Found");
        }

        if (segments.size() == 2) {
            if (request.method != Method::POST) {
                return error_response(405, "Method Not Allowed");
            }
            return register_device(request);
        }

        const std::string& uuid = segments[2];

        if (segments.size() == 3) {
            if (request.method == Method::DELETE_METHOD) {
                return remove_device(uuid);
            }
            if (request.method == Method::GET) {
                return get_device(uuid);
            }
            return error_response(405, "Method Not Allowed");
        }

        if (segments.size() == 4 && segments[3] == "keep-alive") {
            if (request.method != Method::POST) {
                return error_response(405, "Method Not Allowed");
            }
            return keep_alive_device(uuid);
        }

        return error_response(404, "Not Found");
    } catch (const Error& e) {
        return error_response(error_code_to_status_code(e.code()), e.what());
    } catch (const std::exception& e) {
        STILLHERE_LOG_ERROR("unhandled error on {}: {}", request.path, e.what());
        return error_response(500, e.what());
    }
}

Response Router::register_device(const Request& request) const {
    json::json body;
    try {
        body = json::json::parse(request.body);
    } catch (const json::json::parse_error&) {
        return error_response(400, "request body is not valid JSON");
    }

    auto command = json::parse_register_request(body);
    if (command.is_error()) {
        return error_response(error_code_to_status_code(command.error_code()),
                              command.error_message());
    }

    bootstrap_.make_bus()->dispatch(command.value());
    return json_response(201, json::build_uuid_response(command.value().uuid));
}

Response Router::remove_device(const std::string& uuid) const {
    if (!identity::is_uuid(uuid)) {
        return error_response(400, "UUID malformed");
    }
    bootstrap_.make_bus()->dispatch(RemoveDevice(uuid));
    return json_response(200, json::build_uuid_response(uuid));
}

Response Router::keep_alive_device(const std::string& uuid) const {
    if (!identity::is_uuid(uuid)) {
        return error_response(400, "UUID malformed");
    }
    bootstrap_.make_bus()->dispatch(KeepAliveDevice(uuid));
    return json_response(200, json::build_uuid_response(uuid));
}

Response Router::get_device(const std::string& uuid) const {
    if (!identity::is_uuid(uuid)) {
        return error_response(400, "UUID malformed");
    }

    MemoryUnitOfWork uow(bootstrap_.store());
    auto scope = uow.start();
    auto device = uow.devices().get(uuid);
    json::json body = device ? json::device_to_json(*device) : json::json();
    scope.commit();

    if (!device) {
        throw Error(ErrorCode::NotFound, "device " + uuid + " not found");
    }

    return json_response(200, body);
}

Response Router::health() const {
    json::json body = {{"status", "ok"}, {"devices", bootstrap_.store().size()}};
    return json_response(200, body);
}

}  // namespace http
}  // namespace stillhere
