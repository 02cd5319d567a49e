#pragma once

#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace bgupload::upload {

struct OperationResult {
    std::string request_id;
    int status_code = 0;
    std::string raw_result;
    boost::property_tree::ptree result;
};

struct OperationProgress {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    
    double progress_percentage() const;
};

using ProgressSink = std::function<void(const OperationProgress&)>;

enum class FaultKind {
    TRANSPORT,
    SERVER,
    MALFORMED_RESPONSE,
    INVALID_REQUEST,
    NOT_FOUND
};

const char* to_string(FaultKind kind);

class UploadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class OperationCanceledError : public UploadError {
public:
    explicit OperationCanceledError(const std::string& request_id);
    
    const std::string& request_id() const { return request_id_; }
    
private:
    std::string request_id_;
};

class TransferFaultError : public UploadError {
public:
    TransferFaultError(FaultKind kind, const std::string& message,
                       int status_code = 0, std::string error_code = "");
    
    FaultKind kind() const { return kind_; }
    int status_code() const { return status_code_; }
    const std::string& error_code() const { return error_code_; }
    
private:
    FaultKind kind_;
    int status_code_;
    std::string error_code_;
};

}
