#pragma once

/**
 * CprTransferClient.hpp
 * 
 * TransferClient over cpr (libcurl). Bodies are streamed straight to the
 * destination file; resumption uses HTTP range requests.
 */

#include "TransferClient.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace lectern::core::downloader {

/**
 * Decoded resume token
 */
struct ResumePoint {
    std::string url;
    uint64_t offset{0};
};

/**
 * Transfer timing knobs, read from the "downloads" config section
 */
struct TransferOptions {
    int connectTimeoutMs{10000};
    int stallTimeoutSec{30};
    std::string userAgent{"Lectern/1.0"};
    
    static TransferOptions fromConfig();
};

/**
 * CprTransferClient - Sequential HTTP file transfers
 * 
 * Transfers run one at a time, in submission order, on a single worker
 * thread, so a resumed transfer never races the one it replaces on the
 * same file.
 */
class CprTransferClient : public TransferClient {
public:
    explicit CprTransferClient(TransferOptions options = TransferOptions::fromConfig());
    
    /**
     * Destructor - cancels every transfer and joins the worker
     */
    ~CprTransferClient() override;
    
    CprTransferClient(const CprTransferClient&) = delete;
    CprTransferClient& operator=(const CprTransferClient&) = delete;
    
    TransferHandle start(
        const std::string& url,
        const std::filesystem::path& destination,
        TransferProgressCallback onProgress,
        TransferCompletionCallback onComplete
    ) override;
    
    TransferHandle resume(
        const ResumeData& resumeData,
        const std::filesystem::path& destination,
        TransferProgressCallback onProgress,
        TransferCompletionCallback onComplete
    ) override;
    
    void cancel(TransferHandle handle) override;
    
    std::optional<ResumeData> suspend(TransferHandle handle) override;
    
    static ResumeData encodeResumeData(const ResumePoint& point);
    static std::optional<ResumePoint> decodeResumeData(const ResumeData& data);

private:
    struct Transfer {
        TransferHandle handle{0};
        std::string url;
        std::filesystem::path destination;
        
        // Bytes already on disk when the attempt starts
        uint64_t startOffset{0};
        bool validToken{true};
        
        std::atomic<uint64_t> bytesOnDisk{0};
        std::atomic<bool> cancelled{false};
        std::atomic<bool> suspended{false};
        
        TransferProgressCallback onProgress;
        TransferCompletionCallback onComplete;
    };
    
    using TransferPtr = std::shared_ptr<Transfer>;
    
    TransferHandle submit(TransferPtr transfer);
    
    /**
     * Worker body: perform the request, then report exactly once
     */
    void run(const TransferPtr& transfer);
    
    TransferResult execute(Transfer& transfer);
    
    std::optional<ResumeData> tokenFor(const Transfer& transfer) const;

private:
    TransferOptions m_options;
    
    std::unordered_map<TransferHandle, TransferPtr> m_transfers;
    mutable std::mutex m_mutex;
    
    std::atomic<TransferHandle> m_nextHandle{0};
    
    // Declared last: joined before the transfer table goes away
    ThreadPool m_worker;
};

} // namespace lectern::core::downloader
