/**
 * CprTransferClient.cpp
 * 
 * HTTP file transfers with cpr, one at a time.
 */

#include "CprTransferClient.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>

namespace lectern::core::downloader {

using utils::FileUtils;

TransferOptions TransferOptions::fromConfig() {
    auto& config = Config::instance();
    
    TransferOptions options;
    options.connectTimeoutMs = config.get<int>("downloads.connectTimeoutMs", 10000);
    options.stallTimeoutSec = config.get<int>("downloads.stallTimeoutSec", 30);
    return options;
}

CprTransferClient::CprTransferClient(TransferOptions options)
    : m_options(std::move(options))
    , m_worker(1) {
}

CprTransferClient::~CprTransferClient() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [handle, transfer] : m_transfers) {
        transfer->cancelled = true;
    }
}

TransferHandle CprTransferClient::start(
    const std::string& url,
    const std::filesystem::path& destination,
    TransferProgressCallback onProgress,
    TransferCompletionCallback onComplete
) {
    auto transfer = std::make_shared<Transfer>();
    transfer->url = url;
    transfer->destination = destination;
    transfer->onProgress = std::move(onProgress);
    transfer->onComplete = std::move(onComplete);
    
    return submit(std::move(transfer));
}

TransferHandle CprTransferClient::resume(
    const ResumeData& resumeData,
    const std::filesystem::path& destination,
    TransferProgressCallback onProgress,
    TransferCompletionCallback onComplete
) {
    auto transfer = std::make_shared<Transfer>();
    transfer->destination = destination;
    transfer->onProgress = std::move(onProgress);
    transfer->onComplete = std::move(onComplete);
    
    auto point = decodeResumeData(resumeData);
    if (point) {
        transfer->url = point->url;
        transfer->startOffset = point->offset;
        transfer->bytesOnDisk = point->offset;
    } else {
        transfer->validToken = false;
    }
    
    return submit(std::move(transfer));
}

void CprTransferClient::cancel(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = m_transfers.find(handle);
    if (it != m_transfers.end()) {
        it->second->cancelled = true;
        LOG_DEBUG("Transfer {} cancelled", handle);
    }
}

std::optional<ResumeData> CprTransferClient::suspend(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = m_transfers.find(handle);
    if (it == m_transfers.end()) {
        return std::nullopt;
    }
    
    it->second->suspended = true;
    LOG_DEBUG("Transfer {} suspended at {} bytes", handle, it->second->bytesOnDisk.load());
    return tokenFor(*it->second);
}

ResumeData CprTransferClient::encodeResumeData(const ResumePoint& point) {
    nlohmann::json j = {
        {"v", 1},
        {"url", point.url},
        {"offset", point.offset}
    };
    auto text = j.dump();
    return ResumeData(text.begin(), text.end());
}

std::optional<ResumePoint> CprTransferClient::decodeResumeData(const ResumeData& data) {
    auto j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    
    if (!j.contains("url") || !j["url"].is_string() ||
        !j.contains("offset") || !j["offset"].is_number_unsigned()) {
        return std::nullopt;
    }
    
    ResumePoint point;
    point.url = j["url"].get<std::string>();
    point.offset = j["offset"].get<uint64_t>();
    if (point.url.empty()) {
        return std::nullopt;
    }
    return point;
}

TransferHandle CprTransferClient::submit(TransferPtr transfer) {
    transfer->handle = ++m_nextHandle;
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfers[transfer->handle] = transfer;
    }
    
    m_worker.post([this, transfer]() {
        run(transfer);
    });
    
    return transfer->handle;
}

void CprTransferClient::run(const TransferPtr& transfer) {
    TransferResult result;
    
    try {
        result = execute(*transfer);
    } catch (const std::exception& e) {
        LOG_ERROR("Transfer {} failed: {}", transfer->handle, e.what());
        result.outcome = TransferOutcome::IoError;
        result.error = e.what();
    }
    
    // A cancel or suspend that raced the final response still wins
    if (transfer->cancelled) {
        result = TransferResult{};
        result.outcome = TransferOutcome::Cancelled;
    } else if (transfer->suspended && result.outcome != TransferOutcome::Success) {
        result = TransferResult{};
        result.outcome = TransferOutcome::Suspended;
        result.resumeData = tokenFor(*transfer);
    }
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfers.erase(transfer->handle);
    }
    
    if (transfer->onComplete) {
        transfer->onComplete(transfer->handle, result);
    }
}

TransferResult CprTransferClient::execute(Transfer& transfer) {
    TransferResult result;
    
    if (transfer.cancelled || transfer.suspended) {
        result.outcome = transfer.cancelled ? TransferOutcome::Cancelled : TransferOutcome::Suspended;
        return result;
    }
    
    if (!transfer.validToken) {
        result.outcome = TransferOutcome::IoError;
        result.error = "Unusable resume data";
        return result;
    }
    
    const auto& destination = transfer.destination;
    if (destination.has_parent_path() && !FileUtils::ensureDirectory(destination.parent_path())) {
        result.outcome = TransferOutcome::IoError;
        result.error = "Cannot create " + destination.parent_path().string();
        return result;
    }
    
    uint64_t offset = transfer.startOffset;
    if (offset > 0) {
        auto existing = static_cast<uint64_t>(FileUtils::getFileSize(destination));
        if (existing < offset) {
            LOG_WARN("Partial file {} is shorter than its resume point, restarting", destination.string());
            offset = 0;
        } else if (existing > offset && !FileUtils::truncateFile(destination, offset)) {
            offset = 0;
        }
    }
    transfer.bytesOnDisk = offset;
    
    std::ofstream file(destination, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!file.is_open()) {
        result.outcome = TransferOutcome::IoError;
        result.error = "Cannot open " + destination.string();
        return result;
    }
    
    int lastStatus = 0;
    bool bodyStarted = false;
    bool writeFailed = false;
    bool stalled = false;
    double lastReported = -1.0;
    uint64_t lastBytes = offset;
    auto lastActivity = std::chrono::steady_clock::now();
    
    cpr::Session session;
    session.SetUrl(cpr::Url{transfer.url});
    session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::milliseconds(m_options.connectTimeoutMs)});
    session.SetUserAgent(cpr::UserAgent{m_options.userAgent});
    if (offset > 0) {
        session.SetHeader(cpr::Header{{"Range", "bytes=" + std::to_string(offset) + "-"}});
        LOG_INFO("Resuming {} at byte {}", transfer.url, offset);
    }
    
    // Status line of the final response, seen before its body
    session.SetHeaderCallback(cpr::HeaderCallback{[&](auto header, intptr_t) -> bool {
        std::string line(header.data(), header.size());
        if (line.rfind("HTTP/", 0) == 0) {
            auto space = line.find(' ');
            if (space != std::string::npos) {
                lastStatus = std::atoi(line.c_str() + space + 1);
            }
        }
        return true;
    }});
    
    session.SetWriteCallback(cpr::WriteCallback{[&](auto data, intptr_t) -> bool {
        if (transfer.cancelled || transfer.suspended) {
            return false;
        }
        
        if (!bodyStarted) {
            bodyStarted = true;
            if (offset > 0 && lastStatus == 200) {
                LOG_INFO("Server ignored the range request for {}, restarting from zero", transfer.url);
                file.close();
                file.open(destination, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    writeFailed = true;
                    return false;
                }
                offset = 0;
                transfer.bytesOnDisk = 0;
            }
        }
        
        // Error bodies never reach the video file
        if (lastStatus >= 400) {
            return true;
        }
        
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            writeFailed = true;
            return false;
        }
        transfer.bytesOnDisk += data.size();
        return true;
    }});
    
    session.SetProgressCallback(cpr::ProgressCallback{[&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                                         cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                                         intptr_t /*userdata*/) -> bool {
        if (transfer.cancelled || transfer.suspended) {
            return false;
        }
        
        auto now = std::chrono::steady_clock::now();
        uint64_t onDisk = transfer.bytesOnDisk;
        if (onDisk != lastBytes) {
            lastBytes = onDisk;
            lastActivity = now;
        } else if (now - lastActivity > std::chrono::seconds(m_options.stallTimeoutSec)) {
            stalled = true;
            return false;
        }
        
        if (downloadTotal > 0 && lastStatus < 400 && transfer.onProgress) {
            double fraction = static_cast<double>(offset + downloadNow) /
                              static_cast<double>(offset + downloadTotal);
            if (fraction - lastReported >= 0.01 || (fraction >= 1.0 && lastReported < 1.0)) {
                lastReported = fraction;
                transfer.onProgress(transfer.handle, fraction);
            }
        }
        return true;
    }});
    
    cpr::Response response = session.Get();
    file.close();
    
    result.httpStatus = static_cast<int>(response.status_code);
    
    if (transfer.cancelled || transfer.suspended) {
        result.outcome = transfer.cancelled ? TransferOutcome::Cancelled : TransferOutcome::Suspended;
        return result;
    }
    
    if (writeFailed) {
        result.outcome = TransferOutcome::IoError;
        result.error = "Write failed for " + destination.string();
        return result;
    }
    
    if (stalled) {
        result.outcome = TransferOutcome::NetworkError;
        result.error = "Transfer stalled";
        result.resumeData = tokenFor(transfer);
        return result;
    }
    
    if (response.error.code != cpr::ErrorCode::OK || response.status_code == 0) {
        result.outcome = TransferOutcome::NetworkError;
        result.error = response.error.message;
        result.resumeData = tokenFor(transfer);
        return result;
    }
    
    if (response.status_code >= 200 && response.status_code < 300) {
        result.outcome = TransferOutcome::Success;
        LOG_DEBUG("Transfer {} complete: {} bytes", transfer.handle, transfer.bytesOnDisk.load());
        return result;
    }
    
    result.outcome = TransferOutcome::HttpError;
    result.error = "HTTP " + std::to_string(response.status_code);
    return result;
}

std::optional<ResumeData> CprTransferClient::tokenFor(const Transfer& transfer) const {
    uint64_t bytes = transfer.bytesOnDisk;
    if (bytes == 0 || transfer.url.empty()) {
        return std::nullopt;
    }
    return encodeResumeData(ResumePoint{transfer.url, bytes});
}

} // namespace lectern::core::downloader
