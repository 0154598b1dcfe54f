#pragma once

#include "bar.hpp"
#include "error_codes.hpp"
#include "../common/constants.hpp"
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace asciibar {
namespace core {

enum class ReadStatus {
    OK,
    END_OF_STREAM,
    ERROR
};

// bytes_read is meaningful for every status, including END_OF_STREAM and ERROR.
struct ReadResult {
    size_t bytes_read = 0;
    ReadStatus status = ReadStatus::OK;
    std::optional<BarErrorCode> error_code;
    std::string error_message;
};

class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual ReadResult read(char* buffer, size_t size) = 0;
};

class IstreamByteSource : public ByteSource {
public:
    explicit IstreamByteSource(std::istream& input);
    
    ReadResult read(char* buffer, size_t size) override;

private:
    std::istream& input_;
};

// Advances bar by each read's byte count; end of stream forces it to total.
// Reads past total keep their bytes and come back as PROGRESS_FAILURE.
class StreamProgressor : public ByteSource {
public:
    StreamProgressor(Bar& bar, ByteSource& input);
    
    ReadResult read(char* buffer, size_t size) override;

private:
    Bar& bar_;
    ByteSource& input_;
};

struct CopyResult {
    bool success = false;
    size_t bytes_copied = 0;
    size_t progress_errors = 0;
    std::optional<BarErrorCode> error_code;
    std::string error_message;
};

// Drains source into sink until end of stream. Progress failures are counted
// and skipped, any other error stops the copy.
CopyResult copyThrough(ByteSource& source, std::ostream& sink,
                       size_t buffer_size = constants::limits::DEFAULT_COPY_BUFFER_SIZE);

}}
