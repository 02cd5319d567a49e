#include "bgupload/upload/response_parser.hpp"
#include "bgupload/core/utils.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <sstream>

namespace bgupload::upload {

namespace pt = boost::property_tree;

OperationResult ResponseParser::translate(const transfer::TransferRequest& request) {
    if (request.transfer_error && !request.transfer_error->empty()) {
        throw TransferFaultError(FaultKind::TRANSPORT,
                                 "Upload " + request.request_id + " failed: " + *request.transfer_error,
                                 request.status_code);
    }
    
    if (request.status_code == 0) {
        throw TransferFaultError(FaultKind::TRANSPORT,
                                 "Upload " + request.request_id + " completed without a response");
    }
    
    if (!transfer::is_success_status_code(request.status_code)) {
        throw server_fault(request);
    }
    
    OperationResult result;
    result.request_id = request.request_id;
    result.status_code = request.status_code;
    result.raw_result = request.response_body;
    
    try {
        result.result = parse_json(request.response_body);
    } catch (const pt::json_parser_error& e) {
        throw TransferFaultError(FaultKind::MALFORMED_RESPONSE,
                                 "Upload " + request.request_id + " returned a malformed response: " + e.message(),
                                 request.status_code);
    }
    
    return result;
}

pt::ptree ResponseParser::parse_json(const std::string& body) {
    pt::ptree tree;
    if (core::utils::StringUtils::trim(body).empty()) {
        return tree;
    }
    
    std::istringstream stream(body);
    pt::read_json(stream, tree);
    return tree;
}

TransferFaultError ResponseParser::server_fault(const transfer::TransferRequest& request) {
    std::string message = "Upload " + request.request_id + " failed with status " +
                          std::to_string(request.status_code);
    std::string error_code;
    
    try {
        auto body = parse_json(request.response_body);
        if (auto code = body.get_optional<std::string>("error.code")) {
            error_code = *code;
        }
        if (auto text = body.get_optional<std::string>("error.message")) {
            message = *text;
        }
    } catch (const pt::json_parser_error&) {
        // Non-JSON error pages keep the generic message.
    }
    
    return TransferFaultError(FaultKind::SERVER, message, request.status_code, error_code);
}

}
