/*
 * docgate - Tool descriptor helpers
 */
#include <docgate/core/tool.hpp>

namespace docgate {

Json AgentTool::input_schema() const {
    Json properties = Json::object();
    Json required = Json::array();

    for (size_t i = 0; i < params.size(); ++i) {
        const ToolParamSchema& p = params[i];
        Json prop = Json::object();
        prop.set("type", p.type);
        if (!p.description.empty()) {
            prop.set("description", p.description);
        }
        properties.set(p.name, prop);
        if (p.required) {
            required.push(p.name);
        }
    }

    Json schema = Json::object();
    schema.set("type", "object");
    schema.set("properties", properties);
    if (required.size() > 0) {
        schema.set("required", required);
    }
    return schema;
}

} // namespace docgate
