#pragma once

#include <mcp_toolhost/config/app_config.hpp>
#include <mcp_toolhost/core/result.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace mcp_toolhost {

struct WeatherReport {
    std::string city;
    std::string country;
    std::string description;
    double temperature_c = 0.0;
    double feels_like_c = 0.0;
    int humidity_percent = 0;
    double wind_speed_ms = 0.0;
};

// ---------------------------------------------------------------------------
// IWeatherClient: current-conditions lookup.
//
// The get_weather tool depends on this interface rather than on an HTTP
// client, so tests run offline against a mock.
// Methods return Result<T, Error>; never throw on expected failures.
// ---------------------------------------------------------------------------
class IWeatherClient {
public:
    virtual ~IWeatherClient() = default;

    IWeatherClient(const IWeatherClient&) = delete;
    IWeatherClient& operator=(const IWeatherClient&) = delete;

    virtual Result<WeatherReport, Error> CurrentWeather(const std::string& city) = 0;

protected:
    IWeatherClient() = default;
};

// ---------------------------------------------------------------------------
// HttpWeatherClient: OpenWeatherMap "current weather" API over cpp-httplib.
//
// The API key is read from the environment variable named in WeatherConfig
// on every call; it is never logged.
// ---------------------------------------------------------------------------
class HttpWeatherClient : public IWeatherClient {
public:
    explicit HttpWeatherClient(const WeatherConfig& config);
    ~HttpWeatherClient() override;

    Result<WeatherReport, Error> CurrentWeather(const std::string& city) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Parse an OpenWeatherMap /data/2.5/weather response body (metric units).
Result<WeatherReport, Error> ParseWeatherResponse(std::string_view body);

} // namespace mcp_toolhost
