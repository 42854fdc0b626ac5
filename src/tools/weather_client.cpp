#include <mcp_toolhost/tools/weather_client.hpp>

#include <mcp_toolhost/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>

namespace mcp_toolhost {

namespace {

constexpr const char* kComponent = "weather";
constexpr const char* kCurrentWeatherPath = "/data/2.5/weather";

Error MakeWeatherError(const std::string& message,
                       ErrorCategory category,
                       std::optional<std::string> detail = std::nullopt) {
    return Error{"CurrentWeather", message, std::move(detail), std::nullopt,
                 category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Network;
    }
}

double NumberOr(const nlohmann::json& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseWeatherResponse
// ---------------------------------------------------------------------------
Result<WeatherReport, Error> ParseWeatherResponse(std::string_view body) {
    auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result<WeatherReport, Error>::Err(
            MakeWeatherError("Weather service returned invalid JSON",
                             ErrorCategory::Internal));
    }

    auto main = j.find("main");
    if (main == j.end() || !main->is_object() || !main->contains("temp")) {
        return Result<WeatherReport, Error>::Err(
            MakeWeatherError("Weather response has no temperature",
                             ErrorCategory::Internal));
    }

    WeatherReport report;
    report.city = j.value("name", std::string());
    if (auto sys = j.find("sys"); sys != j.end() && sys->is_object()) {
        report.country = sys->value("country", std::string());
    }
    if (auto weather = j.find("weather");
        weather != j.end() && weather->is_array() && !weather->empty() &&
        (*weather)[0].is_object()) {
        report.description = (*weather)[0].value("description", std::string());
    }
    report.temperature_c = NumberOr(*main, "temp", 0.0);
    report.feels_like_c = NumberOr(*main, "feels_like", report.temperature_c);
    report.humidity_percent = static_cast<int>(NumberOr(*main, "humidity", 0.0));
    if (auto wind = j.find("wind"); wind != j.end() && wind->is_object()) {
        report.wind_speed_ms = NumberOr(*wind, "speed", 0.0);
    }

    return Result<WeatherReport, Error>::Ok(std::move(report));
}

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpWeatherClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string api_key_env;

    explicit Impl(const WeatherConfig& config)
        : api_key_env(config.api_key_env) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(std::chrono::seconds(config.timeout_seconds));
        client->set_read_timeout(std::chrono::seconds(config.timeout_seconds));
        client->set_follow_location(true);
        if (config.base_url.rfind("http://", 0) == 0) {
            LogWarn(kComponent, "Weather API key is sent unencrypted to " + config.base_url);
        }
    }
};

HttpWeatherClient::HttpWeatherClient(const WeatherConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpWeatherClient::~HttpWeatherClient() = default;

Result<WeatherReport, Error> HttpWeatherClient::CurrentWeather(
    const std::string& city) {
    const char* api_key = std::getenv(impl_->api_key_env.c_str());
    if (api_key == nullptr || *api_key == '\0') {
        return Result<WeatherReport, Error>::Err(
            MakeWeatherError("Environment variable " + impl_->api_key_env +
                                 " is not set",
                             ErrorCategory::Config));
    }

    httplib::Params params{
        {"q", city},
        {"appid", api_key},
        {"units", "metric"},
    };
    httplib::Headers headers{{"Accept", "application/json"}};

    LogInfo(kComponent, std::string("GET ") + kCurrentWeatherPath + " q=" + city);
    auto res = impl_->client->Get(kCurrentWeatherPath, params, headers);
    if (!res) {
        const auto http_error = res.error();
        return Result<WeatherReport, Error>::Err(
            MakeWeatherError("HTTP request failed: " + httplib::to_string(http_error),
                             CategoryFromHttpTransportError(http_error)));
    }
    LogDebug(kComponent, "  < " + std::to_string(res->status));

    if (res->status != 200) {
        return Result<WeatherReport, Error>::Err(
            Error::FromHttpStatus("CurrentWeather", res->status, res->body));
    }
    return ParseWeatherResponse(res->body);
}

} // namespace mcp_toolhost
