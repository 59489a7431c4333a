#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "common/storage_error.hpp"

namespace chunkvault {
namespace cli {

namespace {

void print_ids(std::ostream& out, const std::string& label, const std::vector<codec::ChunkId>& ids) {
  out << "  " << label << ": " << ids.size() << std::endl;
  for (const auto& id : ids) {
    out << "    " << id << std::endl;
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(engine::RecoveryOrchestrator& orchestrator, const std::string& owner,
         std::istream& in, std::ostream& out)
  : running_(false)
  , orchestrator_(orchestrator)
  , owner_(owner)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for owner " << owner_;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "chunkvault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "chunkvault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "upload" && args.size() == 1) {
    handle_upload_command(args[0]);
  }
  else if (command == "download" && args.size() == 2) {
    handle_download_command(args[0], args[1]);
  }
  else if (command == "delete" && args.size() == 1) {
    handle_delete_command(args[0]);
  }
  else if (command == "sync" && args.size() == 1) {
    handle_sync_command(args[0]);
  }
  else if (command == "verify" && args.size() == 1) {
    handle_verify_command(args[0]);
  }
  else if (command == "ls" && args.empty()) {
    handle_list_command();
  }
  else if (command == "usage" && args.empty()) {
    handle_usage_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments (try 'help')" << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    const std::string name = std::filesystem::path(path).filename().string();
    engine::StoreResult result = orchestrator_.upload(owner_, name, file);
    out_ << "Uploaded " << name << " as " << result.record.id << std::endl
         << "  size: " << result.record.size << " bytes in " << result.record.chunk_count() << " chunks" << std::endl
         << "  checksum: " << result.record.checksum << std::endl
         << "  backup: " << engine::sync_status_to_string(result.sync_status) << std::endl;
    if (!result.warning.empty()) {
      out_ << "  warning: " << result.warning << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Upload failed", e.what());
  }
}

void CLI::handle_download_command(const std::string& file_id, const std::string& output_path) {
  try {
    const std::string bytes = orchestrator_.download(owner_, file_id);
    std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      out_ << "Error opening output file: " << output_path << std::endl;
      return;
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
      out_ << "Error writing output file: " << output_path << std::endl;
      return;
    }
    out_ << "Wrote " << bytes.size() << " bytes to " << output_path << std::endl;
  } catch (const IrrecoverableDataLoss& e) {
    log_and_display_error("Download failed", e.what());
    for (const auto& id : e.chunk_ids()) {
      out_ << "  lost chunk: " << id << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Download failed", e.what());
  }
}

void CLI::handle_delete_command(const std::string& file_id) {
  try {
    orchestrator_.remove(owner_, file_id);
    out_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_sync_command(const std::string& file_id) {
  try {
    engine::StoreResult result = orchestrator_.sync(owner_, file_id);
    out_ << "Backup: " << engine::sync_status_to_string(result.sync_status);
    if (!result.record.backup_locator.empty()) {
      out_ << " (" << result.record.backup_locator << ")";
    }
    out_ << std::endl;
    if (!result.warning.empty()) {
      out_ << "  warning: " << result.warning << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Sync failed", e.what());
  }
}

void CLI::handle_verify_command(const std::string& file_id) {
  try {
    engine::VerifyReport report = orchestrator_.verify(owner_, file_id);
    out_ << "Verification of " << file_id << ":" << std::endl;
    print_ids(out_, "missing in primary", report.missing_primary);
    if (report.backup_enabled) {
      print_ids(out_, "missing in backup", report.missing_backup);
      out_ << "  snapshot: " << (report.snapshot_present ? (report.snapshot_intact ? "intact" : "corrupt") : "absent")
           << std::endl;
    } else {
      out_ << "  backup: disabled" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Verify failed", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    const auto records = orchestrator_.list(owner_);
    if (records.empty()) {
      out_ << "No files stored" << std::endl;
      return;
    }
    for (const auto& record : records) {
      out_ << record.id << "  " << std::setw(12) << record.size << "  "
           << (record.synced ? "[synced] " : "[local]  ") << record.original_name << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e.what());
  }
}

void CLI::handle_usage_command() {
  try {
    engine::UsageReport report = orchestrator_.usage(owner_);
    out_ << "Files: " << report.file_count << std::endl
         << "Primary: " << report.primary.chunk_count << " chunks, " << report.primary.total_bytes << " bytes"
         << std::endl;
    if (report.backup_enabled) {
      out_ << "Backup: " << report.backup.file_count << " snapshots, " << report.backup.chunk_count
           << " chunks, " << report.backup.total_bytes << " bytes" << std::endl;
    } else {
      out_ << "Backup: disabled" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error reading usage", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                  Display this help message" << std::endl;
  out_ << "  upload <path>         Chunk and store local file <path>" << std::endl;
  out_ << "  download <id> <out>   Reconstruct file <id> into <out>" << std::endl;
  out_ << "  delete <id>           Delete file <id> from both tiers" << std::endl;
  out_ << "  sync <id>             Mirror file <id> to the backup tier" << std::endl;
  out_ << "  verify <id>           Report missing chunks of file <id>" << std::endl;
  out_ << "  ls                    List stored files" << std::endl;
  out_ << "  usage                 Show storage usage" << std::endl;
  out_ << "  quit                  Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace chunkvault
