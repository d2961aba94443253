/*
 * docgate - documentation gateway for MCP clients
 *
 * Exposes llms.txt documentation sources as MCP tools over stdio. Every
 * document fetch is checked against a domain allowlist.
 *
 * Usage:
 *   ./docgate --urls Name:https://host/llms.txt [options]
 *   ./docgate --json sources.json [options]
 */

#include <docgate/core/application.hpp>

int main(int argc, char* argv[]) {
    docgate::Application& app = docgate::Application::instance();

    if (!app.init(argc, argv)) {
        app.shutdown();
        return app.exit_code();
    }

    int rc = app.run();
    app.shutdown();
    return rc;
}
