#ifndef HEADER_ASSEMBLER_HPP
#define HEADER_ASSEMBLER_HPP

#include <map>
#include <string>
#include <vector>
#include "complete_multipart_upload_request.hpp"

// Produces the header set for a CompleteMultipartUpload call. Only fields
// that are set produce a header; "content-type" is always present.
//
// request_payer_values is the allow-list for RequestPayer; a value outside
// it throws InvalidEnumValue.
std::map<std::string, std::string> AssembleHeaders(const CompleteMultipartUploadRequest& request,
                                                   const std::vector<std::string>& request_payer_values);

#endif // HEADER_ASSEMBLER_HPP
