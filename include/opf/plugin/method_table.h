#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opf::plugin {

/**
 * Method name to handler map served by a PluginDispatcher.
 *
 * Handlers receive a Context cancelled when the dispatcher stops serving and
 * return the response payload or an error. A SerializationError is reported
 * to the host as MARSHAL_ERROR, every other error as RPC_ERROR.
 */
class MethodTable {
public:
    using Handler = std::function<Result<Bytes>(const Context&, const Bytes&)>;

    MethodTable& add(std::string name, Handler handler) {
        handlers_.insert_or_assign(std::move(name), std::move(handler));
        return *this;
    }

    /**
     * Register a handler over protobuf messages:
     * Result<Resp> fn(const Context&, const Req&).
     */
    template <typename Req, typename Resp, typename Fn>
    MethodTable& addMessage(std::string name, Fn fn) {
        return add(std::move(name),
                   [fn = std::move(fn)](const Context& ctx, const Bytes& payload) -> Result<Bytes> {
                       Req request;
                       if (!request.ParseFromArray(payload.data(),
                                                   static_cast<int>(payload.size()))) {
                           return Error{ErrorCode::SerializationError,
                                        "failed to unmarshal request"};
                       }
                       Result<Resp> response = fn(ctx, request);
                       if (!response) {
                           return response.error();
                       }
                       std::string out;
                       if (!response.value().SerializeToString(&out)) {
                           return Error{ErrorCode::SerializationError,
                                        "failed to marshal response"};
                       }
                       return Bytes(out.begin(), out.end());
                   });
    }

    /**
     * Find the handler for a wire method name. The name is reduced to its last
     * '/' segment ("/pkg.Service/Echo" -> "Echo"); an exact entry wins,
     * otherwise the part after the last '.' is tried ("pkg.Service.Echo").
     * Null when nothing matches.
     */
    const Handler* resolve(std::string_view method) const {
        if (auto slash = method.rfind('/'); slash != std::string_view::npos) {
            method = method.substr(slash + 1);
        }
        if (auto it = handlers_.find(std::string(method)); it != handlers_.end()) {
            return &it->second;
        }
        if (auto dot = method.rfind('.'); dot != std::string_view::npos) {
            if (auto it = handlers_.find(std::string(method.substr(dot + 1)));
                it != handlers_.end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(handlers_.size());
        for (const auto& [name, handler] : handlers_) {
            out.push_back(name);
        }
        return out;
    }

    size_t size() const noexcept { return handlers_.size(); }
    bool empty() const noexcept { return handlers_.empty(); }

private:
    std::map<std::string, Handler> handlers_;
};

} // namespace opf::plugin
