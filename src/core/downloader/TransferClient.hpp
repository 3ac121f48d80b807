#pragma once

/**
 * TransferClient.hpp
 * 
 * Performs the byte transfer of one file, with progress reporting and
 * resumable interruption.
 */

#include "DownloadTask.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace lectern::core::downloader {

/**
 * Identifies one transfer attempt (0 = none)
 */
using TransferHandle = uint64_t;

/**
 * How a transfer ended
 */
enum class TransferOutcome {
    Success,
    NetworkError,   // connectivity lost or stalled; resumable
    HttpError,      // server answered with an error status
    IoError,        // local write failure or unusable resume token
    Cancelled,      // cancel(): token discarded
    Suspended       // suspend(): token handed to the caller
};

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::Success};
    
    // Set for NetworkError and Suspended when any byte reached the disk
    std::optional<ResumeData> resumeData;
    
    int httpStatus{0};
    std::string error;
    
    bool isConnectivityError() const {
        return outcome == TransferOutcome::NetworkError;
    }
};

/**
 * Progress callback: fraction in 0.0 - 1.0
 */
using TransferProgressCallback = std::function<void(TransferHandle handle, double fraction)>;

/**
 * Completion callback, invoked exactly once per transfer
 */
using TransferCompletionCallback = std::function<void(TransferHandle handle, const TransferResult& result)>;

/**
 * Callbacks run on the client's own thread, never from inside start(),
 * resume(), cancel() or suspend().
 */
class TransferClient {
public:
    virtual ~TransferClient() = default;
    
    /**
     * Start a fresh transfer, replacing any file at the destination
     * @return Handle of the new transfer
     */
    virtual TransferHandle start(
        const std::string& url,
        const std::filesystem::path& destination,
        TransferProgressCallback onProgress,
        TransferCompletionCallback onComplete
    ) = 0;
    
    /**
     * Continue a transfer from a token returned by suspend() or carried by
     * a NetworkError result
     * @return Handle of the new transfer
     */
    virtual TransferHandle resume(
        const ResumeData& resumeData,
        const std::filesystem::path& destination,
        TransferProgressCallback onProgress,
        TransferCompletionCallback onComplete
    ) = 0;
    
    /**
     * Abort a transfer and discard its resume token
     */
    virtual void cancel(TransferHandle handle) = 0;
    
    /**
     * Stop a transfer, keeping what reached the disk
     * @return Resume token, nullopt for an unknown handle
     */
    virtual std::optional<ResumeData> suspend(TransferHandle handle) = 0;
};

} // namespace lectern::core::downloader
