#pragma once

#include "message_output/output_options.hpp"
#include "message_retrieval/message_sink.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace message_output {

/**
 * @brief Writes messages to a file, or to a numbered series of files
 *
 * A single file is used when the message count limit fits in one file.
 * Otherwise files are named <stem>.<index><ext>, starting at index 0, each
 * holding at most messagesPerFile messages. Plain output separates messages
 * within a file with the configured delimiter.
 */
class FileOutput : public message_retrieval::IMessageSink {
public:
    FileOutput(const std::string& path, OutputFormat format, bool compact,
               const FileOutputConfig& config, int64_t messageCountLimit);
    ~FileOutput() override;

    FileOutput(const FileOutput&) = delete;
    FileOutput& operator=(const FileOutput&) = delete;

    /**
     * @throws std::runtime_error if a file cannot be opened or written
     */
    void write(const broker_client::DeliveredMessage& message) override;
    void flush() override;

    bool isRotating() const { return rotating_; }

    // Every file opened so far, in order
    const std::vector<std::string>& files() const { return files_; }

    static std::string rotatedFileName(const std::string& path, size_t index);

private:
    std::string path_;
    OutputFormat format_;
    bool compact_;
    FileOutputConfig config_;
    bool rotating_;

    std::ofstream stream_;
    std::vector<std::string> files_;
    size_t messagesInFile_ = 0;
    size_t nextIndex_ = 0;

    void openNext();
    void closeCurrent();
};

} // namespace message_output
