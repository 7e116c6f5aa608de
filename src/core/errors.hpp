#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include "change_summary.hpp"

// Base class for fatal publish failures. The engine attaches whatever it
// completed before failing; nothing is rolled back, so the target is in
// an unknown state and a re-publish is the way to reconcile it.
class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& what) : std::runtime_error(what) {}

    void set_partial_summary(const ChangeSummary& summary) { partial_ = summary; }
    const std::optional<ChangeSummary>& partial_summary() const { return partial_; }

private:
    std::optional<ChangeSummary> partial_;
};

// Connecting, listing or a structural operation on the remote side failed.
class TransportError : public SyncError {
public:
    explicit TransportError(const std::string& what) : SyncError(what) {}
};

// Every attempt of one upload batch failed.
class BatchUploadError : public SyncError {
public:
    BatchUploadError(const std::string& what, int batch_number)
        : SyncError(what), batch_number_(batch_number) {}

    int batch_number() const { return batch_number_; }

private:
    int batch_number_;
};

// A cancellation request was observed between steps.
class CancelledError : public SyncError {
public:
    explicit CancelledError(const std::string& what) : SyncError(what) {}
};

// The local source tree could not be read.
class LocalSourceError : public SyncError {
public:
    explicit LocalSourceError(const std::string& what) : SyncError(what) {}
};
