#include <mcp_toolhost/tools/movie_catalog.hpp>

#include <algorithm>

namespace mcp_toolhost {

MovieCatalog::MovieCatalog(std::vector<Movie> movies)
    : movies_(std::move(movies)) {}

MovieCatalog MovieCatalog::WithDefaultProgram() {
    return MovieCatalog({
        {1, "Inception", "PG-13", 148, {"14:30", "18:00", "21:15"}},
        {2, "Toy Story", "G", 81, {"10:00", "12:30", "15:00"}},
        {3, "The Dark Knight", "PG-13", 152, {"17:00", "20:30"}},
        {4, "Alien", "R", 117, {"19:45", "22:30"}},
        {5, "Paddington 2", "PG", 103, {"11:00", "13:30", "16:00"}},
    });
}

const Movie* MovieCatalog::FindMovie(int movie_id) const {
    auto it = std::find_if(movies_.begin(), movies_.end(),
                           [movie_id](const Movie& m) { return m.id == movie_id; });
    return it == movies_.end() ? nullptr : &*it;
}

Result<Booking, std::string> MovieCatalog::Book(int movie_id,
                                                const std::string& show_time,
                                                int num_tickets) {
    if (num_tickets <= 0) {
        return Result<Booking, std::string>::Err("numTickets must be positive");
    }
    if (num_tickets > kMaxTicketsPerBooking) {
        return Result<Booking, std::string>::Err(
            "numTickets must not exceed " + std::to_string(kMaxTicketsPerBooking) +
            " per booking");
    }

    const auto* movie = FindMovie(movie_id);
    if (movie == nullptr) {
        return Result<Booking, std::string>::Err(
            "Movie not found: " + std::to_string(movie_id));
    }

    const auto& times = movie->showtimes;
    if (std::find(times.begin(), times.end(), show_time) == times.end()) {
        std::string available;
        for (const auto& t : times) {
            if (!available.empty()) available += ", ";
            available += t;
        }
        return Result<Booking, std::string>::Err(
            "Show time " + show_time + " is not available for '" + movie->title +
            "'. Available: " + available);
    }

    return Result<Booking, std::string>::Ok(
        Booking{next_booking_id_++, movie->id, movie->title, show_time, num_tickets});
}

std::optional<int> MovieCatalog::MinimumAge(std::string_view rating) {
    if (rating == "G" || rating == "PG") return 0;
    if (rating == "PG-13") return 13;
    if (rating == "R") return 17;
    if (rating == "NC-17") return 18;
    return std::nullopt;
}

} // namespace mcp_toolhost
