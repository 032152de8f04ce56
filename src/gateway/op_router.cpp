#include "gateway/op_router.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace voxgate::gateway {

namespace {

std::string string_field(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j[field].is_null()) return "";
    if (!j[field].is_string()) {
        throw core::InvalidRequest(std::string("field '") + field + "' must be a string");
    }
    return j[field].get<std::string>();
}

} // namespace

Request Request::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw core::InvalidRequest("request must be a JSON object");
    }

    Request request;
    request.op = string_field(j, "op");
    request.credential = string_field(j, "credential");
    request.source_ip = string_field(j, "source_ip");
    if (j.contains("body") && !j["body"].is_null()) {
        if (!j["body"].is_object()) {
            throw core::InvalidRequest("field 'body' must be an object");
        }
        request.body = j["body"];
    }
    return request;
}

nlohmann::json Caller::skill_context() const {
    return {{"source", source_ip}, {"client", client_id}, {"tier", tier}};
}

void OpRouter::register_op(const std::string& op, OpPolicy policy, Handler handler) {
    routes_[op] = Route{std::move(policy), std::move(handler)};
}

const OpRouter::Route* OpRouter::find(const std::string& op) const {
    auto it = routes_.find(op);
    return it == routes_.end() ? nullptr : &it->second;
}

std::vector<std::string> OpRouter::ops() const {
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& [name, route] : routes_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace voxgate::gateway
