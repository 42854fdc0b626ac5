#include <mcp_toolhost/mcp/mcp_tool_handlers.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace mcp_toolhost {

namespace {

constexpr int kMaxPlausibleAge = 150;

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Get a required non-empty string argument. Sets reason on failure.
std::optional<std::string> RequireString(const nlohmann::json& args,
                                         const std::string& key,
                                         std::string& reason) {
    if (!args.contains(key) || !args[key].is_string() ||
        args[key].get<std::string>().empty()) {
        reason = "Missing required parameter: " + key;
        return std::nullopt;
    }
    return args[key].get<std::string>();
}

// Get a required integer argument. Sets reason on failure.
std::optional<int> RequireInt(const nlohmann::json& args,
                              const std::string& key,
                              std::string& reason) {
    if (!args.contains(key)) {
        reason = "Missing required parameter: " + key;
        return std::nullopt;
    }
    if (!args[key].is_number_integer()) {
        reason = "Parameter '" + key + "' must be an integer";
        return std::nullopt;
    }
    const auto& value = args[key];
    bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <=
              static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        reason = "Parameter '" + key + "' is out of range";
        return std::nullopt;
    }
    return static_cast<int>(value.get<std::int64_t>());
}

std::string Join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string FormatOneDecimal(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

nlohmann::json MovieToJson(const Movie& m) {
    return {{"id", m.id},
            {"title", m.title},
            {"rating", m.rating},
            {"durationMinutes", m.duration_minutes},
            {"showtimes", m.showtimes}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// get_movies
HandlerOutcome HandleGetMovies(const MovieCatalog& catalog) {
    std::string text = "Now showing:";
    nlohmann::json movies = nlohmann::json::array();
    for (const auto& m : catalog.Movies()) {
        text += "\n" + std::to_string(m.id) + ". " + m.title + " (" + m.rating +
                ", " + std::to_string(m.duration_minutes) + " min): " +
                Join(m.showtimes, ", ");
        movies.push_back(MovieToJson(m));
    }
    return ToolSuccess(std::move(text), {{"movies", movies}});
}

// book_ticket
HandlerOutcome HandleBookTicket(MovieCatalog& catalog,
                                const nlohmann::json& args) {
    std::string reason;
    auto movie_id = RequireInt(args, "movieId", reason);
    if (!movie_id) return ToolFailure(reason);
    auto show_time = RequireString(args, "showTime", reason);
    if (!show_time) return ToolFailure(reason);
    auto num_tickets = RequireInt(args, "numTickets", reason);
    if (!num_tickets) return ToolFailure(reason);

    auto booked = catalog.Book(*movie_id, *show_time, *num_tickets);
    if (booked.IsErr()) return ToolFailure(booked.Error());

    const auto& b = booked.Value();
    std::string text = "Booking #" + std::to_string(b.booking_id) +
                       " confirmed: " + std::to_string(b.num_tickets) +
                       (b.num_tickets == 1 ? " ticket" : " tickets") +
                       " for '" + b.movie_title + "' at " + b.show_time + ".";
    return ToolSuccess(std::move(text),
                       {{"bookingId", b.booking_id},
                        {"movieId", b.movie_id},
                        {"movieTitle", b.movie_title},
                        {"showTime", b.show_time},
                        {"numTickets", b.num_tickets}});
}

// validate_age
HandlerOutcome HandleValidateAge(const MovieCatalog& catalog,
                                 const nlohmann::json& args) {
    std::string reason;
    auto age = RequireInt(args, "age", reason);
    if (!age) return ToolFailure(reason);
    if (*age < 0 || *age > kMaxPlausibleAge) {
        return ToolFailure("age must be between 0 and " +
                           std::to_string(kMaxPlausibleAge));
    }
    auto movie_id = RequireInt(args, "movieId", reason);
    if (!movie_id) return ToolFailure(reason);

    const auto* movie = catalog.FindMovie(*movie_id);
    if (movie == nullptr) {
        return ToolFailure("Movie not found: " + std::to_string(*movie_id));
    }
    auto minimum = MovieCatalog::MinimumAge(movie->rating);
    if (!minimum) {
        return ToolFailure("Unknown rating '" + movie->rating + "' for '" +
                           movie->title + "'");
    }

    const bool allowed = *age >= *minimum;
    std::string text = allowed
        ? "Age " + std::to_string(*age) + " may watch '" + movie->title +
              "' (rated " + movie->rating + ")."
        : "Age " + std::to_string(*age) + " may not watch '" + movie->title +
              "' (rated " + movie->rating + ", minimum age " +
              std::to_string(*minimum) + ").";
    return ToolSuccess(std::move(text),
                       {{"allowed", allowed},
                        {"age", *age},
                        {"movieId", movie->id},
                        {"rating", movie->rating},
                        {"minimumAge", *minimum}});
}

// get_weather
HandlerOutcome HandleGetWeather(IWeatherClient& weather,
                                const nlohmann::json& args) {
    std::string reason;
    auto city = RequireString(args, "city", reason);
    if (!city) return ToolFailure(reason);

    auto result = weather.CurrentWeather(*city);
    if (result.IsErr()) {
        const auto& err = result.Error();
        std::string msg = "Weather lookup failed: " + err.message;
        if (err.detail) msg += ": " + *err.detail;
        return ToolFailure(std::move(msg));
    }

    const auto& w = result.Value();
    std::string place = w.city.empty() ? *city : w.city;
    if (!w.country.empty()) place += ", " + w.country;

    std::string text = "Weather in " + place + ": ";
    if (!w.description.empty()) text += w.description + ", ";
    text += FormatOneDecimal(w.temperature_c) + "°C (feels like " +
            FormatOneDecimal(w.feels_like_c) + "°C), humidity " +
            std::to_string(w.humidity_percent) + "%, wind " +
            FormatOneDecimal(w.wind_speed_ms) + " m/s";

    return ToolSuccess(std::move(text),
                       {{"city", w.city},
                        {"country", w.country},
                        {"description", w.description},
                        {"temperatureC", w.temperature_c},
                        {"feelsLikeC", w.feels_like_c},
                        {"humidityPercent", w.humidity_percent},
                        {"windSpeedMs", w.wind_speed_ms}});
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterBuiltinTools
// ---------------------------------------------------------------------------
void RegisterBuiltinTools(HandlerResolver& resolver,
                          MovieCatalog& catalog,
                          IWeatherClient& weather) {
    resolver.Register("get_movies", [&catalog](const nlohmann::json&) {
        return HandleGetMovies(catalog);
    });

    resolver.Register("book_ticket", [&catalog](const nlohmann::json& args) {
        return HandleBookTicket(catalog, args);
    });

    resolver.Register("validate_age", [&catalog](const nlohmann::json& args) {
        return HandleValidateAge(catalog, args);
    });

    resolver.Register("get_weather", [&weather](const nlohmann::json& args) {
        return HandleGetWeather(weather, args);
    });
}

} // namespace mcp_toolhost
