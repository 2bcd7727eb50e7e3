#include <exception>
#include <iostream>
#include <memory>

#include "app/sql_app.hpp"
#include "config/config.hpp"
#include "query/command_executor.hpp"

int main() {
    const auto config = sqlcli::load_config();
    if (!config.has_value()) {
        std::cerr << "sqlcli: " << config.error().message << std::endl;
        return 2;
    }

    try {
        sqlcli::SqlApp app(
            std::make_unique<sqlcli::CommandQueryExecutor>(config->query_command, config->field_separator),
            config->history_file);
        return app.run();
    } catch (const std::exception &e) {
        std::cerr << "sqlcli: " << e.what() << std::endl;
        return 1;
    }
}
