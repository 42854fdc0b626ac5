#include <catch2/catch_test_macros.hpp>

#include <mcp_toolhost/mcp/mcp_tool_handlers.hpp>

#include "../../test/mocks/mock_weather_client.hpp"

#include <string>

using namespace mcp_toolhost;
using namespace mcp_toolhost::testing;

namespace {

struct Fixture {
    Fixture() : catalog(MovieCatalog::WithDefaultProgram()) {
        RegisterBuiltinTools(resolver, catalog, weather);
    }

    Result<nlohmann::json, RpcError> Call(const std::string& tool,
                                          const nlohmann::json& args) {
        return resolver.Call(tool, args);
    }

    static std::string Text(const Result<nlohmann::json, RpcError>& r) {
        return r.Value()["content"][0]["text"].get<std::string>();
    }

    MovieCatalog catalog;
    MockWeatherClient weather;
    HandlerResolver resolver;
};

WeatherReport LondonReport() {
    WeatherReport report;
    report.city = "London";
    report.country = "GB";
    report.description = "light rain";
    report.temperature_c = 12.3;
    report.feels_like_c = 11.6;
    report.humidity_percent = 81;
    report.wind_speed_ms = 4.1;
    return report;
}

} // anonymous namespace

TEST_CASE("RegisterBuiltinTools: registers the four tools", "[mcp][handlers]") {
    Fixture f;
    CHECK(f.resolver.HasHandler("get_movies"));
    CHECK(f.resolver.HasHandler("book_ticket"));
    CHECK(f.resolver.HasHandler("validate_age"));
    CHECK(f.resolver.HasHandler("get_weather"));
    CHECK(f.resolver.Names().size() == 4);
}

// ===========================================================================
// get_movies
// ===========================================================================

TEST_CASE("get_movies: lists the program as text and structured content", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("get_movies", nlohmann::json::object());
    REQUIRE(r.IsOk());

    auto text = Fixture::Text(r);
    CHECK(text.find("Now showing:") == 0);
    CHECK(text.find("1. Inception (PG-13, 148 min): 14:30, 18:00, 21:15") != std::string::npos);
    CHECK(text.find("Toy Story") != std::string::npos);

    const auto& movies = r.Value()["structuredContent"]["movies"];
    REQUIRE(movies.size() == 5);
    CHECK(movies[0]["id"] == 1);
    CHECK(movies[0]["rating"] == "PG-13");
    CHECK(movies[3]["title"] == "Alien");
    CHECK(movies[3]["showtimes"].size() == 2);
}

// ===========================================================================
// book_ticket
// ===========================================================================

TEST_CASE("book_ticket: confirms a valid booking", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("book_ticket", {{"movieId", 1}, {"showTime", "14:30"}, {"numTickets", 2}});
    REQUIRE(r.IsOk());

    CHECK(Fixture::Text(r) == "Booking #1001 confirmed: 2 tickets for 'Inception' at 14:30.");
    CHECK(r.Value()["structuredContent"]["bookingId"] == 1001);
    CHECK(f.catalog.BookingCount() == 1);
}

TEST_CASE("book_ticket: zero tickets is rejected", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("book_ticket", {{"movieId", 1}, {"showTime", "14:30"}, {"numTickets", 0}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc::kToolExecutionFailed);
    CHECK(r.Error().message == "numTickets must be positive");
    CHECK(f.catalog.BookingCount() == 0);
}

TEST_CASE("book_ticket: unknown show time lists the alternatives", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("book_ticket", {{"movieId", 4}, {"showTime", "09:00"}, {"numTickets", 1}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().message ==
          "Show time 09:00 is not available for 'Alien'. Available: 19:45, 22:30");
}

TEST_CASE("book_ticket: missing or mistyped arguments", "[mcp][handlers]") {
    Fixture f;
    auto missing = f.Call("book_ticket", {{"movieId", 1}, {"numTickets", 1}});
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().message == "Missing required parameter: showTime");

    auto mistyped = f.Call("book_ticket", {{"movieId", "1"}, {"showTime", "14:30"}, {"numTickets", 1}});
    REQUIRE(mistyped.IsErr());
    CHECK(mistyped.Error().message == "Parameter 'movieId' must be an integer");
}

TEST_CASE("book_ticket: ticket count beyond int range is rejected", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("book_ticket",
                    {{"movieId", 1}, {"showTime", "14:30"}, {"numTickets", 4294967297LL}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Parameter 'numTickets' is out of range");
    CHECK(f.catalog.BookingCount() == 0);

    auto huge = f.Call("book_ticket",
                       {{"movieId", 1}, {"showTime", "14:30"},
                        {"numTickets", 18446744073709551615ULL}});
    REQUIRE(huge.IsErr());
    CHECK(huge.Error().message == "Parameter 'numTickets' is out of range");
}

// ===========================================================================
// validate_age
// ===========================================================================

TEST_CASE("validate_age: allowed and refused by rating", "[mcp][handlers]") {
    Fixture f;

    auto teen = f.Call("validate_age", {{"age", 13}, {"movieId", 1}});
    REQUIRE(teen.IsOk());
    CHECK(teen.Value()["structuredContent"]["allowed"] == true);
    CHECK(Fixture::Text(teen) == "Age 13 may watch 'Inception' (rated PG-13).");

    auto child = f.Call("validate_age", {{"age", 12}, {"movieId", 4}});
    REQUIRE(child.IsOk());
    CHECK(child.Value()["structuredContent"]["allowed"] == false);
    CHECK(child.Value()["structuredContent"]["minimumAge"] == 17);
    CHECK(Fixture::Text(child) ==
          "Age 12 may not watch 'Alien' (rated R, minimum age 17).");

    auto toddler = f.Call("validate_age", {{"age", 3}, {"movieId", 2}});
    REQUIRE(toddler.IsOk());
    CHECK(toddler.Value()["structuredContent"]["allowed"] == true);
}

TEST_CASE("validate_age: implausible age and unknown movie", "[mcp][handlers]") {
    Fixture f;

    auto negative = f.Call("validate_age", {{"age", -1}, {"movieId", 1}});
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().message == "age must be between 0 and 150");

    auto ancient = f.Call("validate_age", {{"age", 200}, {"movieId", 1}});
    CHECK(ancient.IsErr());

    auto unknown = f.Call("validate_age", {{"age", 30}, {"movieId", 99}});
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().message == "Movie not found: 99");
}

TEST_CASE("validate_age: age beyond int range is rejected", "[mcp][handlers]") {
    Fixture f;

    auto wrapped = f.Call("validate_age", {{"age", 4294967313LL}, {"movieId", 1}});
    REQUIRE(wrapped.IsErr());
    CHECK(wrapped.Error().message == "Parameter 'age' is out of range");

    auto negative = f.Call("validate_age", {{"age", -4294967296LL}, {"movieId", 1}});
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().message == "Parameter 'age' is out of range");
}

// ===========================================================================
// get_weather
// ===========================================================================

TEST_CASE("get_weather: formats the report", "[mcp][handlers]") {
    Fixture f;
    f.weather.Enqueue(Result<WeatherReport, Error>::Ok(LondonReport()));

    auto r = f.Call("get_weather", {{"city", "London"}});
    REQUIRE(r.IsOk());
    CHECK(Fixture::Text(r) ==
          "Weather in London, GB: light rain, 12.3°C (feels like 11.6°C), "
          "humidity 81%, wind 4.1 m/s");
    CHECK(r.Value()["structuredContent"]["humidityPercent"] == 81);

    REQUIRE(f.weather.Calls().size() == 1);
    CHECK(f.weather.Calls()[0] == "London");
}

TEST_CASE("get_weather: missing city never reaches the client", "[mcp][handlers]") {
    Fixture f;
    auto r = f.Call("get_weather", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Missing required parameter: city");
    CHECK(f.weather.Calls().empty());
}

TEST_CASE("get_weather: client errors carry the upstream reason", "[mcp][handlers]") {
    Fixture f;
    f.weather.Enqueue(Result<WeatherReport, Error>::Err(
        Error::FromHttpStatus("CurrentWeather", 404,
                              R"({"cod":"404","message":"city not found"})")));

    auto r = f.Call("get_weather", {{"city", "Atlantis"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc::kToolExecutionFailed);
    CHECK(r.Error().message == "Weather lookup failed: Not found: city not found");
}

TEST_CASE("get_weather: missing API key is reported", "[mcp][handlers]") {
    Fixture f;
    f.weather.Enqueue(Result<WeatherReport, Error>::Err(
        Error{"CurrentWeather", "Environment variable OPENWEATHER_API_KEY is not set",
              std::nullopt, std::nullopt, ErrorCategory::Config}));

    auto r = f.Call("get_weather", {{"city", "Paris"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().message ==
          "Weather lookup failed: Environment variable OPENWEATHER_API_KEY is not set");
}
