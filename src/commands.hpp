#pragma once
#include <string>
#include <vector>

namespace deskmcp {

int cmd_server(const std::string& host, int port);
int cmd_agent(const std::string& name, const std::string& host, int port, const std::string& server_url);
int cmd_call(const std::string& tool_name, const std::string& params_json);
int cmd_tools();
int cmd_agents();
int cmd_status(const std::string& instance_id);

} // namespace deskmcp
