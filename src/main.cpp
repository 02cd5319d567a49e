#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <stop_token>
#include "bgupload/core/logger.hpp"
#include "bgupload/core/config.hpp"
#include "bgupload/core/cli.hpp"
#include "bgupload/core/utils.hpp"
#include "bgupload/transfer/local_transfer_service.hpp"
#include "bgupload/upload/pending_upload.hpp"

namespace {

using namespace bgupload;
using core::utils::StringUtils;

int run_upload(const core::CommandLineParser& parser) {
    auto args = parser.command_args();
    if (args.empty()) {
        std::cerr << "Usage: bgupload upload <file> [uri]\n";
        return 1;
    }
    
    auto& config = core::Config::instance();
    transfer::LocalTransferService service(transfer::LocalServiceOptions::from_config(config));
    
    auto status_code = parser.get_int_option("status").value_or(201);
    if (!transfer::is_success_status_code(static_cast<int>(status_code))) {
        service.set_responder([status_code](const transfer::TransferRequest&) {
            return transfer::SimulatedResponse{
                static_cast<int>(status_code),
                R"({"error":{"code":"upload_rejected","message":"The server rejected the upload"}})"};
        });
    }
    
    transfer::TransferRequest request;
    request.request_id = "upload-" + std::to_string(
        std::chrono::system_clock::now().time_since_epoch().count());
    request.kind = transfer::TransferKind::UPLOAD;
    request.upload_location = args[0];
    request.request_uri = args.size() > 1 ? args[1] : "local://me/skydrive/files";
    
    if (!service.add(request)) {
        std::cerr << "Error: cannot queue " << args[0] << "\n";
        return 1;
    }
    
    if (auto fail_at = parser.get_int_option("fail-at"); fail_at && *fail_at >= 0) {
        service.inject_transfer_error(request.request_id, static_cast<std::uint64_t>(*fail_at),
                                      "Connection reset by peer");
    }
    
    auto queued = service.find(request.request_id);
    if (!queued) {
        std::cerr << "Error: request " << request.request_id << " disappeared\n";
        return 1;
    }
    
    upload::PendingUpload pending(service, *queued, upload::UploadOptions::from_config(config));
    
    std::stop_source cancel;
    auto future = pending.attach(cancel.get_token(), [](const upload::OperationProgress& progress) {
        std::cout << "  " << StringUtils::format_bytes(progress.bytes_transferred) << " / "
                  << StringUtils::format_bytes(progress.total_bytes) << " ("
                  << StringUtils::format_percentage(progress.progress_percentage()) << ")\n";
    });
    
    auto cancel_after = parser.get_int_option("cancel-after").value_or(-1);
    std::jthread canceller;
    if (cancel_after >= 0) {
        canceller = std::jthread([&cancel, cancel_after](std::stop_token stop) {
            std::mutex mutex;
            std::condition_variable_any cv;
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, stop, std::chrono::milliseconds(cancel_after), [] { return false; });
            if (!stop.stop_requested()) {
                cancel.request_stop();
            }
        });
    }
    
    auto started_at = std::chrono::steady_clock::now();
    std::cout << "Uploading " << args[0] << " as " << request.request_id << "\n";
    service.start(request.request_id);
    
    int exit_code = 0;
    try {
        auto result = future.get();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);
        
        std::cout << "Upload finished in " << StringUtils::format_duration(elapsed)
                  << " (status " << result.status_code << ")\n";
        std::cout << "  id:   " << result.result.get<std::string>("id", "<none>") << "\n";
        std::cout << "  name: " << result.result.get<std::string>("name", "<none>") << "\n";
    } catch (const upload::OperationCanceledError& e) {
        std::cout << "Upload canceled: " << e.what() << "\n";
        exit_code = 2;
    } catch (const upload::TransferFaultError& e) {
        std::cerr << "Upload failed (" << upload::to_string(e.kind()) << "): " << e.what() << "\n";
        if (!e.error_code().empty()) {
            std::cerr << "  error code: " << e.error_code() << "\n";
        }
        exit_code = 1;
    }
    
    canceller.request_stop();
    return exit_code;
}

}

int main(int argc, char* argv[]) {
    bgupload::core::CommandLineParser parser("bgupload");
    parser.add_option("", "cancel-after", "Cancel the upload after this many milliseconds",
                      bgupload::core::OptionType::Integer);
    parser.add_option("", "fail-at", "Inject a transport error once this many bytes were sent",
                      bgupload::core::OptionType::Integer);
    parser.add_option("", "status", "Status code the simulated server answers with",
                      bgupload::core::OptionType::Integer);
    parser.add_command("upload", "upload <file> [uri]",
                       "Queue an upload on the local transfer service and attach to it");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = bgupload::core::Config::instance();
    config.set_defaults();
    
    auto config_file = bgupload::core::utils::FileUtils::expand_user(parser.get_option("config"));
    if (bgupload::core::utils::FileUtils::exists(config_file) &&
        !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: cannot read " << config_file.string() << ", using defaults\n";
    }
    
    auto log_level = parser.has_option("verbose") ?
        bgupload::core::LogLevel::Debug :
        bgupload::core::Logger::level_from_string(config.get_string("log.level", "info"));
    bgupload::core::Logger::initialize(config.get_string("log.file", "bgupload.log"), log_level);
    
    LOG_INFO("bgupload starting up");
    
    int exit_code = 0;
    if (parser.command() == "upload") {
        exit_code = run_upload(parser);
    } else {
        parser.print_help();
    }
    
    bgupload::core::Logger::shutdown();
    return exit_code;
}
