#include "mediarelay/TransferTypes.hpp"

#include <cctype>
#include <cstdint>

namespace mediarelay {

const char *priorityClassName(PriorityClass p) {
    switch (p) {
    case PriorityClass::Interactive:
        return "Interactive";
    case PriorityClass::Bulk:
        return "Bulk";
    }
    return "Unknown";
}

const char *slotKindName(SlotKind k) {
    switch (k) {
    case SlotKind::BulkReserved:
        return "BulkReserved";
    case SlotKind::InteractiveReserved:
        return "InteractiveReserved";
    }
    return "Unknown";
}

const char *outcomeName(TransferOutcome o) {
    switch (o) {
    case TransferOutcome::Success:
        return "Success";
    case TransferOutcome::Failure:
        return "Failure";
    case TransferOutcome::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::DuplicateRequest:
        return "DuplicateRequest";
    case ErrorKind::AlreadyComplete:
        return "AlreadyComplete";
    case ErrorKind::SourceUnavailable:
        return "SourceUnavailable";
    case ErrorKind::SourceReadError:
        return "SourceReadError";
    case ErrorKind::StagingError:
        return "StagingError";
    case ErrorKind::SinkUploadError:
        return "SinkUploadError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *enqueueStatusName(EnqueueResult::Status s) {
    switch (s) {
    case EnqueueResult::Status::Accepted:
        return "Accepted";
    case EnqueueResult::Status::AlreadyQueued:
        return "AlreadyQueued";
    case EnqueueResult::Status::AlreadyComplete:
        return "AlreadyComplete";
    }
    return "Unknown";
}

std::string makeTaskId(const ObjectLocator &loc) {
    return loc.container + ":" + loc.objectRef;
}

bool parseLocator(const std::string &text, ObjectLocator &out,
                  std::string &err) {
    const std::size_t slash = text.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= text.size()) {
        err = "Locator must look like container/object: " + text;
        return false;
    }
    out.container = text.substr(0, slash);
    out.objectRef = text.substr(slash + 1);
    return true;
}

std::string sanitizeFileName(const std::string &raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == ':' || std::iscntrl(uc))
            out.push_back('_');
        else
            out.push_back(c);
    }
    // A lone "." or ".." would escape the staging/sink directory.
    if (out == "." || out == "..")
        out = "_";
    return out;
}

std::string idDigest(const std::string &raw) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (char c : raw) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001b3ULL;
    }
    static const char hex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = hex[h & 0xf];
        h >>= 4;
    }
    return out;
}

std::string deriveDisplayName(const ObjectLocator &loc) {
    std::string ref = loc.objectRef;
    while (!ref.empty() && ref.back() == '/')
        ref.pop_back();
    const std::size_t slash = ref.find_last_of('/');
    std::string base =
        (slash == std::string::npos) ? ref : ref.substr(slash + 1);
    if (base.empty())
        return sanitizeFileName(makeTaskId(loc));
    return sanitizeFileName(base);
}

TransferTask makeTask(const ObjectLocator &loc, PriorityClass priority) {
    TransferTask t;
    t.id = makeTaskId(loc);
    t.locator = loc;
    t.displayName = deriveDisplayName(loc);
    t.priorityClass = priority;
    t.enqueuedAt = std::chrono::system_clock::now();
    return t;
}

} // namespace mediarelay
