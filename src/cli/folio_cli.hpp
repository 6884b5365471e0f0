#pragma once

#include <string>
#include <vector>
#include <iosfwd>
#include <core/types.hpp>
#include <server/route_table.hpp>
#include <templates/template_types.hpp>

// Startup sequence of the server: options, template resolution, connection
// directory, route table. Everything after that belongs to the HTTP and
// kernel collaborators.
class FolioCLI {
public:
    explicit FolioCLI(std::ostream& out);

    // Returns the process exit status.
    int run(const std::vector<std::string>& args);

private:
    Result<ServerOptions> load_options(const std::vector<std::string>& args, bool& done);

    void print_resolution(const std::string& template_name, const TemplatePaths& paths);
    void print_routes(const std::vector<Route>& routes);

    std::ostream& out_;
};
