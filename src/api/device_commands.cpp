// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_commands.h"

namespace turion {

json DeviceCommandBuilder::simple_print_command(uint64_t sequence_id, const char* command) {
    return {{"print",
             {{"sequence_id", std::to_string(sequence_id)}, {"command", command}, {"param", ""}}}};
}

json DeviceCommandBuilder::gcode_line(uint64_t sequence_id, const std::string& gcode) {
    return {{"print",
             {{"sequence_id", std::to_string(sequence_id)},
              {"command", "gcode_line"},
              {"param", gcode},
              {"user_id", "0"}}}};
}

json DeviceCommandBuilder::gcode_file(uint64_t sequence_id, const std::string& url) {
    return {{"print",
             {{"sequence_id", std::to_string(sequence_id)},
              {"command", "gcode_file"},
              {"param", url}}}};
}

json DeviceCommandBuilder::stop(uint64_t sequence_id) {
    return simple_print_command(sequence_id, "stop");
}

json DeviceCommandBuilder::pause(uint64_t sequence_id) {
    return simple_print_command(sequence_id, "pause");
}

json DeviceCommandBuilder::resume(uint64_t sequence_id) {
    return simple_print_command(sequence_id, "resume");
}

json DeviceCommandBuilder::project_file(uint64_t sequence_id, const ProjectPrintOptions& options) {
    // An empty task name counts as unset
    std::string task_name = options.task_name && !options.task_name->empty()
                                ? *options.task_name
                                : base_name(options.url);

    json print = {
        {"sequence_id", std::to_string(sequence_id)},
        {"command", "project_file"},
        {"param", "Metadata/plate_" + std::to_string(options.plate_id) + ".gcode"},
        {"project_id", "0"},
        {"profile_id", "0"},
        {"task_id", "0"},
        {"subtask_id", "0"},
        {"subtask_name", task_name},
        {"file", ""},
        {"url", options.url},
        {"md5", ""},
        {"timelapse", options.timelapse},
        {"bed_type", options.bed_type},
        {"bed_levelling", options.bed_levelling},
        {"flow_cali", options.flow_calibration},
        {"vibration_cali", options.vibration_calibration},
        {"layer_inspect", options.layer_inspect},
        {"ams_mapping", options.ams_mapping},
        {"use_ams", !options.ams_mapping.empty()},
    };
    return {{"print", std::move(print)}};
}

json DeviceCommandBuilder::push_all(uint64_t sequence_id) {
    return {{"pushing",
             {{"sequence_id", std::to_string(sequence_id)},
              {"command", "pushall"},
              {"version", 1},
              {"push_target", 1}}}};
}

std::string DeviceCommandBuilder::base_name(const std::string& url) {
    size_t slash = url.find_last_of('/');
    if (slash == std::string::npos) {
        return url;
    }
    return url.substr(slash + 1);
}

std::string DeviceCommandBuilder::command_name(const json& msg) {
    if (!msg.is_object()) {
        return "";
    }
    for (const char* group : {"print", "pushing", "system", "info"}) {
        auto it = msg.find(group);
        if (it != msg.end() && it->is_object()) {
            auto cmd = it->find("command");
            if (cmd != it->end() && cmd->is_string()) {
                return cmd->get<std::string>();
            }
        }
    }
    return "";
}

} // namespace turion
