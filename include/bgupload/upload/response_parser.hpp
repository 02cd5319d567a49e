#pragma once

#include "operation_types.hpp"
#include "bgupload/transfer/transfer_types.hpp"
#include <boost/property_tree/ptree.hpp>
#include <string>

namespace bgupload::upload {

// Turns the snapshot of a completed request into the caller-facing outcome.
class ResponseParser {
public:
    // Returns the success result, or throws TransferFaultError describing
    // why the completed request failed.
    static OperationResult translate(const transfer::TransferRequest& request);
    
    // Empty or whitespace-only bodies parse to an empty tree. Throws
    // boost::property_tree::json_parser_error on malformed input.
    static boost::property_tree::ptree parse_json(const std::string& body);
    
private:
    static TransferFaultError server_fault(const transfer::TransferRequest& request);
};

}
