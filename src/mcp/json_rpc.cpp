#include <mcp_toolhost/mcp/json_rpc.hpp>

#include <cstddef>

namespace mcp_toolhost {

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, const RpcError& error) {
    return MakeError(id, error.code, error.message);
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

namespace {

// SAX handler that remembers the value of the top-level "id" member and
// gives up at the first syntax error. The nlohmann SAX parser keeps its
// nesting state on the heap, so arbitrarily long lines cannot exhaust the
// stack.
class TopLevelIdFinder : public nlohmann::json_sax<nlohmann::json> {
public:
    std::optional<nlohmann::json> id;

    bool null() override { return Skip(); }
    bool boolean(bool) override { return Skip(); }
    bool number_integer(number_integer_t val) override { return Take(val); }
    bool number_unsigned(number_unsigned_t val) override { return Take(val); }
    bool number_float(number_float_t val, const string_t&) override { return Take(val); }
    bool string(string_t& val) override { return Take(val); }
    bool binary(binary_t&) override { return Skip(); }

    bool start_object(std::size_t) override { return Open(); }
    bool end_object() override { return Close(); }
    bool start_array(std::size_t) override { return Open(); }
    bool end_array() override { return Close(); }

    bool key(string_t& val) override {
        expect_id_ = depth_ == 1 && val == "id";
        return true;
    }

    bool parse_error(std::size_t, const std::string&,
                     const nlohmann::json::exception&) override {
        return false;
    }

private:
    template <typename T>
    bool Take(const T& val) {
        if (expect_id_ && depth_ == 1) {
            id = nlohmann::json(val);
        }
        expect_id_ = false;
        return true;
    }

    bool Skip() {
        expect_id_ = false;
        return true;
    }

    bool Open() {
        expect_id_ = false;
        ++depth_;
        return true;
    }

    bool Close() {
        --depth_;
        return true;
    }

    std::size_t depth_ = 0;
    bool expect_id_ = false;
};

} // namespace

std::optional<nlohmann::json> SalvageId(std::string_view raw) {
    TopLevelIdFinder finder;
    // The result is false for every line that reaches this point; only the
    // id recorded before the error matters.
    (void)nlohmann::json::sax_parse(raw.begin(), raw.end(), &finder);
    return finder.id;
}

Result<void, RpcError> CheckEnvelope(const nlohmann::json& message) {
    if (!message.is_object()) {
        return Result<void, RpcError>::Err(
            RpcError{rpc::kInvalidRequest, "Invalid Request: message must be a JSON object"});
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        return Result<void, RpcError>::Err(
            RpcError{rpc::kInvalidRequest, "Invalid JSON-RPC version"});
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Result<void, RpcError>::Err(
            RpcError{rpc::kInvalidRequest, "Invalid Request: missing method"});
    }

    auto params = message.find("params");
    if (params != message.end() && !params->is_object() && !params->is_array()) {
        return Result<void, RpcError>::Err(
            RpcError{rpc::kInvalidRequest, "Invalid Request: params must be an object or array"});
    }

    return Result<void, RpcError>::Ok();
}

std::string SerializeMessage(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_toolhost
