#include "message_output/file_output.hpp"
#include "message_output/formatters.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace message_output {

FileOutput::FileOutput(const std::string& path, OutputFormat format, bool compact,
                       const FileOutputConfig& config, int64_t messageCountLimit)
    : path_(path), format_(format), compact_(compact), config_(config) {
    if (path_.empty()) {
        throw std::invalid_argument("Output file path is empty");
    }
    if (config_.messagesPerFile == 0) {
        throw std::invalid_argument("messagesPerFile must be greater than zero");
    }

    rotating_ = messageCountLimit <= 0 ||
                static_cast<uint64_t>(messageCountLimit) > config_.messagesPerFile;

    spdlog::debug("Writing messages to {} as {} (rotating: {})", path_, outputFormatToString(format_), rotating_);

    // A single file is created up front so a bad path fails before retrieval starts
    if (!rotating_) {
        openNext();
    }
}

FileOutput::~FileOutput() {
    closeCurrent();
}

std::string FileOutput::rotatedFileName(const std::string& path, size_t index) {
    std::filesystem::path original(path);
    std::string name = original.stem().string() + "." + std::to_string(index) + original.extension().string();
    return (original.parent_path() / name).string();
}

void FileOutput::write(const broker_client::DeliveredMessage& message) {
    if (!stream_.is_open() || (rotating_ && messagesInFile_ >= config_.messagesPerFile)) {
        openNext();
    }

    if (messagesInFile_ > 0 && format_ == OutputFormat::Plain) {
        stream_ << config_.messageDelimiter << '\n';
    }

    stream_ << formatMessage(message, format_, compact_) << '\n';
    if (!stream_) {
        throw std::runtime_error("Failed to write message " + std::to_string(message.getDeliveryTag()) +
                                 " to " + files_.back());
    }

    ++messagesInFile_;
    spdlog::trace("Message #{} written to {}", message.getDeliveryTag(), files_.back());
}

void FileOutput::flush() {
    if (!stream_.is_open()) {
        return;
    }

    stream_.flush();
    if (!stream_) {
        throw std::runtime_error("Failed to flush " + files_.back());
    }
}

void FileOutput::openNext() {
    closeCurrent();

    std::string fileName = rotating_ ? rotatedFileName(path_, nextIndex_++) : path_;
    spdlog::debug("Creating output file {}", fileName);

    stream_.open(fileName, std::ios::out | std::ios::trunc);
    if (!stream_.is_open()) {
        throw std::runtime_error("Failed to open output file: " + fileName);
    }

    files_.push_back(fileName);
    messagesInFile_ = 0;
}

void FileOutput::closeCurrent() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
    stream_.clear();
}

} // namespace message_output
