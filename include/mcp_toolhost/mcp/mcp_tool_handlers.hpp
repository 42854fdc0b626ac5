#pragma once

#include <mcp_toolhost/mcp/handler_resolver.hpp>
#include <mcp_toolhost/tools/movie_catalog.hpp>
#include <mcp_toolhost/tools/weather_client.hpp>

namespace mcp_toolhost {

// Register the built-in tool handlers (get_movies, book_ticket, validate_age,
// get_weather). Each handler captures &catalog / &weather by reference;
// both must outlive the resolver. Single-threaded.
void RegisterBuiltinTools(HandlerResolver& resolver,
                          MovieCatalog& catalog,
                          IWeatherClient& weather);

} // namespace mcp_toolhost
