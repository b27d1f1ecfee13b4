/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file writer.cpp
 * @brief Implementation of the persistence writer thread.
 *
 * @details
 * Files are opened with C stdio in append mode and line buffering so each record
 * reaches the kernel as soon as it is written; once per rotation check the batch
 * written since the previous check is additionally `fsync`ed to stable storage.
 */

#include "xlogd/storage/writer.hpp"

#include "xlogd/infra/logger.hpp"
#include "xlogd/record/canonical_json.hpp"
#include "xlogd/record/path_resolver.hpp"
#include "xlogd/record/record.hpp"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

namespace xlogd::storage {

/**
 * @class Writer::Worker
 * @brief The writer thread's state, co-owned by the thread and the `Writer` handle.
 */
class Writer::Worker {
  public:
    Worker(const infra::Config& config, infra::Clock& clock, infra::RecordQueue& queue,
           view::Viewer* viewer)
        : config_(config), clock_(clock), queue_(queue), viewer_(viewer), stop_requested_(false),
          stopped_(false), failed_(false), log_file_(nullptr), last_check_(0.0), since_flush_(0),
          records_written_(0), files_opened_(0)
    {
    }

    ~Worker() { close_file(); }

    const infra::Config config_;
    infra::Clock& clock_;
    infra::RecordQueue& queue_;
    view::Viewer* viewer_;

    std::atomic<bool> stop_requested_;
    std::atomic<bool> stopped_;
    std::atomic<bool> failed_;
    std::mutex stopped_mutex_;
    std::condition_variable stopped_cv_;

    // Rotation state.
    std::string log_pfn_;
    std::FILE* log_file_;
    double last_check_;
    size_t since_flush_;
    mutable std::mutex path_mutex_;

    std::atomic<size_t> records_written_;
    std::atomic<size_t> files_opened_;

    void run();
    bool wait_stopped(std::chrono::milliseconds timeout);
    void mark_stopped();
    void process(const std::string& record);
    void persist(const std::string& line);
    void rotate_check();
    void flush_batch();
    bool open_file();
    void close_file();
    void forward_to_viewer(const std::string& line);
    void fault(const std::string& message);
};

Writer::Writer(const infra::Config& config, infra::Clock& clock, infra::RecordQueue& queue,
               view::Viewer* viewer)
    : worker_(std::make_shared<Worker>(config, clock, queue, viewer))
{
}

Writer::~Writer()
{
    request_stop();
    if (!thread_.joinable()) {
        return;
    }
    if (worker_->wait_stopped(kDetachGrace)) {
        thread_.join();
        worker_->close_file();
        return;
    }
    infra::Logger::log(infra::LogLevel::ERROR,
                       "Writer: thread ignored STOP; detaching it from '" + current_path() + "'");
    thread_.detach();
}

void Writer::start()
{
    const infra::Config& config = worker_->config_;
    if (config.log_path.empty() && !config.verbose) {
        throw WriterError("Writer: no log_path and console rendering disabled");
    }
    if (config.verbose && !worker_->viewer_) {
        throw WriterError("Writer: verbose mode requires a viewer");
    }
    std::shared_ptr<Worker> worker = worker_;
    thread_ = std::thread([worker] { worker->run(); });
}

void Writer::request_stop()
{
    worker_->stop_requested_ = true;
}

bool Writer::wait_stopped(std::chrono::milliseconds timeout)
{
    return worker_->wait_stopped(timeout);
}

bool Writer::stopped() const
{
    return worker_->stopped_.load();
}

bool Writer::failed() const
{
    return worker_->failed_.load();
}

void Writer::close()
{
    if (!worker_->stopped_) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Writer: still running, leaving '" + current_path() + "' open");
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    worker_->close_file();
}

void Writer::process(const std::string& record)
{
    worker_->process(record);
}

size_t Writer::records_written() const
{
    return worker_->records_written_.load();
}

size_t Writer::files_opened() const
{
    return worker_->files_opened_.load();
}

std::string Writer::current_path() const
{
    std::lock_guard<std::mutex> lock(worker_->path_mutex_);
    return worker_->log_pfn_;
}

bool Writer::Worker::wait_stopped(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(stopped_mutex_);
    return stopped_cv_.wait_for(lock, timeout, [this] { return stopped_.load(); });
}

void Writer::Worker::mark_stopped()
{
    {
        std::lock_guard<std::mutex> lock(stopped_mutex_);
        stopped_ = true;
    }
    stopped_cv_.notify_all();
}

/**
 * @brief Writer thread body.
 *
 * The stop flag is checked only at the top of the loop, so a record that has
 * already been popped is always written before the thread exits.
 */
void Writer::Worker::run()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Writer: thread begins");
    try {
        while (true) {
            if (stop_requested_) {
                infra::Logger::log(infra::LogLevel::DEBUG, "Writer: STOPping");
                close_file();
                break;
            }

            auto record = queue_.pop_for(kPollInterval);
            if (!record) {
                continue;
            }
            process(*record);
        }
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL, std::string("Writer: ") + e.what());
        failed_ = true;
        close_file();
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Writer: thread ends");
    mark_stopped();
}

void Writer::Worker::process(const std::string& record)
{
    std::string line = record;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    if (!config_.log_path.empty()) {
        persist(line);
    } else if (!config_.verbose) {
        throw WriterError("Writer: no log_path and console rendering disabled");
    }

    if (config_.verbose && viewer_) {
        forward_to_viewer(line);
    }
}

void Writer::Worker::persist(const std::string& line)
{
    if (log_pfn_.empty() || clock_.current().utc_ts - last_check_ >= 1.0) {
        rotate_check();
    }

    if (!log_file_ && !open_file()) {
        return;
    }

    if (std::fputs(line.c_str(), log_file_) == EOF || std::fputc('\n', log_file_) == EOF) {
        fault("Writer: write to '" + log_pfn_ + "' failed: " + std::strerror(errno));
        return;
    }
    ++since_flush_;
    ++records_written_;
}

/**
 * @brief Once-per-second housekeeping: durability of the last batch, then rotation.
 */
void Writer::Worker::rotate_check()
{
    infra::ClockSnapshot now = clock_.refresh();
    last_check_ = now.utc_ts;

    flush_batch();

    auto path = record::PathResolver::resolve(config_.log_path, now, config_.me);
    std::string next = path ? *path : "";
    if (next != log_pfn_) {
        close_file();
        std::lock_guard<std::mutex> lock(path_mutex_);
        if (!log_pfn_.empty()) {
            infra::Logger::log(infra::LogLevel::INFO,
                               "Writer: rolling '" + log_pfn_ + "' -> '" + next + "'");
        }
        log_pfn_ = next;
    }
}

void Writer::Worker::flush_batch()
{
    if (!log_file_ || since_flush_ == 0) {
        return;
    }
    if (std::fflush(log_file_) != 0 || ::fsync(fileno(log_file_)) != 0) {
        fault("Writer: flush of '" + log_pfn_ + "' failed: " + std::strerror(errno));
        return;
    }
    if (!config_.verbose) {
        infra::Logger::mark('.');
    }
    since_flush_ = 0;
}

bool Writer::Worker::open_file()
{
    fs::path p(log_pfn_);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            fault("Writer: cannot create '" + p.parent_path().string() + "': " + ec.message());
            return false;
        }
    }

    log_file_ = std::fopen(log_pfn_.c_str(), "a");
    if (!log_file_) {
        fault("Writer: cannot open '" + log_pfn_ + "': " + std::strerror(errno));
        return false;
    }
    std::setvbuf(log_file_, nullptr, _IOLBF, BUFSIZ);
    ++files_opened_;
    infra::Logger::log(infra::LogLevel::DEBUG, "Writer: opened '" + log_pfn_ + "'");
    return true;
}

void Writer::Worker::close_file()
{
    if (!log_file_) {
        return;
    }
    if (std::fclose(log_file_) != 0) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Writer: close of '" + log_pfn_ + "' failed: " + std::strerror(errno));
    }
    log_file_ = nullptr;
    since_flush_ = 0;
}

/**
 * @brief Reports a persistence fault; fatal unless the console can still show records.
 */
void Writer::Worker::fault(const std::string& message)
{
    infra::Logger::log(infra::LogLevel::ERROR, message);
    if (!config_.verbose) {
        throw WriterError(message);
    }
}

/**
 * @brief Decodes a record and hands it to the viewer.
 *
 * Failures go straight to stderr: the viewer normally logs through `Logger`, so the
 * logger itself may be what failed.
 */
void Writer::Worker::forward_to_viewer(const std::string& line)
{
    try {
        record::RecordFields fields;
        if (!record::RecordCodec::decode(line, fields)) {
            throw std::runtime_error("record has fewer than 9 fields");
        }
        record::ScopedJson event(cJSON_Parse(fields.json.c_str()));
        if (!event) {
            throw std::runtime_error("record payload is not JSON");
        }
        viewer_->render(fields, event.get());
    } catch (const std::exception& e) {
        std::cerr << "!! " << line << " !! " << e.what() << " !!" << std::endl;
    } catch (...) {
        std::cerr << "!! " << line << " !! unknown viewer failure !!" << std::endl;
    }
}

} // namespace xlogd::storage
