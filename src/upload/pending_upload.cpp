#include "bgupload/upload/pending_upload.hpp"
#include <stdexcept>

namespace bgupload::upload {

PendingUpload::PendingUpload(transfer::TransferService& service,
                             transfer::TransferRequest request,
                             UploadOptions options)
    : coordinator_(service, options)
    , request_(std::move(request)) {
    if (!request_.is_upload()) {
        throw std::invalid_argument("Request " + request_.request_id + " is not an upload");
    }
}

std::future<OperationResult> PendingUpload::attach() {
    return coordinator_.attach(request_);
}

std::future<OperationResult> PendingUpload::attach(std::stop_token cancel, ProgressSink progress) {
    return coordinator_.attach(request_, std::move(cancel), std::move(progress));
}

}
