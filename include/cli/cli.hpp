#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "engine/recovery_orchestrator.hpp"

namespace chunkvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(engine::RecoveryOrchestrator& orchestrator, const std::string& owner,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one command line. Returns false once the shell should stop.
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    engine::RecoveryOrchestrator& orchestrator_;
    std::string owner_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::string& path);
    void handle_download_command(const std::string& file_id, const std::string& output_path);
    void handle_delete_command(const std::string& file_id);
    void handle_sync_command(const std::string& file_id);
    void handle_verify_command(const std::string& file_id);
    void handle_list_command();
    void handle_usage_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunkvault
