#include "asciibar/core/stream_progressor.hpp"
#include "asciibar/common/logger.hpp"
#include <vector>

namespace asciibar {
namespace core {

IstreamByteSource::IstreamByteSource(std::istream& input)
    : input_(input) {}

ReadResult IstreamByteSource::read(char* buffer, size_t size) {
    ReadResult result;
    
    if (size == 0) {
        return result;
    }
    
    input_.read(buffer, static_cast<std::streamsize>(size));
    result.bytes_read = static_cast<size_t>(input_.gcount());
    
    if (input_.bad()) {
        result.status = ReadStatus::ERROR;
        result.error_code = BarErrorCode::READ_FAILED;
        result.error_message = BarErrorCodeHelper::getMessage(BarErrorCode::READ_FAILED);
    } else if (input_.eof()) {
        result.status = ReadStatus::END_OF_STREAM;
    } else if (input_.fail()) {
        result.status = ReadStatus::ERROR;
        result.error_code = BarErrorCode::READ_FAILED;
        result.error_message = BarErrorCodeHelper::getMessage(BarErrorCode::READ_FAILED);
    }
    
    return result;
}

StreamProgressor::StreamProgressor(Bar& bar, ByteSource& input)
    : bar_(bar), input_(input) {}

ReadResult StreamProgressor::read(char* buffer, size_t size) {
    ReadResult result = input_.read(buffer, size);
    
    if (result.status == ReadStatus::END_OF_STREAM) {
        bar_.set(bar_.total());
        return result;
    }
    
    if (result.status == ReadStatus::ERROR) {
        return result;
    }
    
    std::optional<BarErrorCode> err;
    int current = bar_.current();
    auto remaining = static_cast<long long>(bar_.total()) - current;
    if (remaining < 0 || result.bytes_read > static_cast<unsigned long long>(remaining)) {
        err = BarErrorCode::MAX_CURRENT_EXCEEDED;
    } else {
        err = bar_.set(current + static_cast<int>(result.bytes_read));
    }
    
    if (err) {
        result.status = ReadStatus::ERROR;
        result.error_code = BarErrorCode::PROGRESS_FAILURE;
        result.error_message = std::string(BarErrorCodeHelper::getMessage(BarErrorCode::PROGRESS_FAILURE)) +
                               ": " + BarErrorCodeHelper::getMessage(*err);
    }
    
    return result;
}

CopyResult copyThrough(ByteSource& source, std::ostream& sink, size_t buffer_size) {
    CopyResult result;
    std::vector<char> buffer(buffer_size > 0 ? buffer_size : constants::limits::DEFAULT_COPY_BUFFER_SIZE);
    
    while (true) {
        ReadResult chunk = source.read(buffer.data(), buffer.size());
        
        if (chunk.bytes_read > 0) {
            sink.write(buffer.data(), static_cast<std::streamsize>(chunk.bytes_read));
            if (!sink) {
                result.success = false;
                result.error_message = "Failed to write to sink";
                common::Logger::instance().error("[Copy] Write failed | copied={}", result.bytes_copied);
                return result;
            }
            result.bytes_copied += chunk.bytes_read;
        }
        
        if (chunk.status == ReadStatus::END_OF_STREAM) {
            result.success = true;
            break;
        }
        
        if (chunk.status == ReadStatus::ERROR) {
            if (chunk.error_code == BarErrorCode::PROGRESS_FAILURE) {
                result.progress_errors++;
                common::Logger::instance().debug("[Copy] Progress failure | copied={} | error={}",
                                                 result.bytes_copied, chunk.error_message);
                continue;
            }
            
            result.success = false;
            result.error_code = chunk.error_code;
            result.error_message = chunk.error_message;
            common::Logger::instance().error("[Copy] Read failed | copied={} | error={}",
                                             result.bytes_copied, chunk.error_message);
            return result;
        }
    }
    
    if (result.progress_errors > 0) {
        common::Logger::instance().warn("[Copy] Source exceeded expected size | copied={} | progress_errors={}",
                                        result.bytes_copied, result.progress_errors);
    }
    
    common::Logger::instance().debug("[Copy] Complete | copied={}", result.bytes_copied);
    return result;
}

}}
