#include "RemoteAddressValidator.hpp"
#include "../headers/customHeaders.hpp"
#include "../debug/log.hpp"

#include <mutex>
#include <memory>

#include <pistache/client.h>
#include <glaze/glaze.hpp>
#include <fmt/format.h>

struct SValidationRequest {
    std::string address = "";
    std::string network = "";
};

struct SValidationResponse {
    bool valid = false;
};

// shared with the client callbacks, which may outlive a timed out wait
struct SValidationState {
    std::mutex                      lock;
    std::expected<bool, eAuthError> result = std::unexpected(AUTH_ERROR_DEPENDENCY_UNAVAILABLE);
};

CRemoteAddressValidator::CRemoteAddressValidator(const std::string& endpoint, const std::string& apiKey, std::chrono::milliseconds timeout) :
    m_endpoint(endpoint), m_apiKey(apiKey), m_timeout(timeout) {
    ;
}

std::expected<bool, eAuthError> CRemoteAddressValidator::validate(const std::string& address, const std::string& network) {
    const auto BODY = glz::write_json(SValidationRequest{.address = address, .network = network});
    if (!BODY) {
        Debug::log(ERR, "Address validation: couldn't serialize request");
        return std::unexpected(AUTH_ERROR_DEPENDENCY_UNAVAILABLE);
    }

    auto                                 state = std::make_shared<SValidationState>();

    Pistache::Http::Experimental::Client client;
    client.init(Pistache::Http::Experimental::Client::options().maxConnectionsPerHost(8).threads(1));

    auto builder = client.post(m_endpoint);
    builder.body(BODY.value());
    builder.header(std::make_shared<Pistache::Http::Header::ContentType>(MIME(Application, Json)));
    if (!m_apiKey.empty())
        builder.header(std::make_shared<ApiKeyHeader>(m_apiKey));
    builder.timeout(m_timeout);

    auto resp = builder.send();
    resp.then(
        [state](Pistache::Http::Response resp) {
            std::lock_guard<std::mutex> lg(state->lock);

            const int CODE = (int)resp.code();
            if (CODE < 200 || CODE >= 300) {
                Debug::log(WARN, "Address validation: service replied {}", CODE);
                return;
            }

            const std::string   BODY = resp.body();
            SValidationResponse parsed;
            if (auto err = glz::read<glz::opts{.error_on_unknown_keys = false}>(parsed, BODY); err) {
                Debug::log(WARN, "Address validation: malformed reply: {}", glz::format_error(err, BODY));
                return;
            }

            state->result = parsed.valid;
        },
        [state](std::exception_ptr e) {
            try {
                std::rethrow_exception(e);
            } catch (std::exception& e) { Debug::log(WARN, "Address validation failed: {}", e.what()); } catch (...) {
                Debug::log(WARN, "Address validation failed: unknown error");
            }
        });

    Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
    b.wait_for(m_timeout);

    client.shutdown();

    std::lock_guard<std::mutex> lg(state->lock);
    if (!state->result)
        Debug::log(WARN, "Address validation for network {} unavailable", network);
    return state->result;
}
