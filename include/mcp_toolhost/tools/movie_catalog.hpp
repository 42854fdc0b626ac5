#pragma once

#include <mcp_toolhost/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_toolhost {

struct Movie {
    int id = 0;
    std::string title;
    std::string rating;  // G, PG, PG-13, R, NC-17
    int duration_minutes = 0;
    std::vector<std::string> showtimes;  // "HH:MM", local time
};

struct Booking {
    int booking_id = 0;
    int movie_id = 0;
    std::string movie_title;
    std::string show_time;
    int num_tickets = 0;
};

// ---------------------------------------------------------------------------
// MovieCatalog: in-memory cinema program. Bookings are confirmed and
// numbered but not stored; ids restart with the process.
// ---------------------------------------------------------------------------
class MovieCatalog {
public:
    static constexpr int kMaxTicketsPerBooking = 10;
    static constexpr int kFirstBookingId = 1001;

    explicit MovieCatalog(std::vector<Movie> movies);

    // The program shipped with the server.
    static MovieCatalog WithDefaultProgram();

    [[nodiscard]] const std::vector<Movie>& Movies() const noexcept { return movies_; }
    [[nodiscard]] int BookingCount() const noexcept {
        return next_booking_id_ - kFirstBookingId;
    }

    // Returns nullptr for an unknown id.
    [[nodiscard]] const Movie* FindMovie(int movie_id) const;

    // Book tickets. The error is a user-facing reason.
    Result<Booking, std::string> Book(int movie_id, const std::string& show_time,
                                      int num_tickets);

    // Minimum viewer age for an MPA rating; nullopt for an unknown rating.
    static std::optional<int> MinimumAge(std::string_view rating);

private:
    std::vector<Movie> movies_;
    int next_booking_id_ = kFirstBookingId;
};

} // namespace mcp_toolhost
