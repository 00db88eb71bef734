#pragma once
#include <stdexcept>
#include <string>

// Every failure the engine reports is a SchedulerError carrying an ErrorKind,
// so callers can branch on the condition without string matching.
enum class ErrorKind {
    InvalidRating,
    InvalidDeckConfig,
    InvalidArgument,
    CardSuspended,
    UnknownCard,
    UnknownDeck,
    UnknownNote,
    DuplicateNote,
    DuplicateDeck,
    Storage
};

const char* errorKindName(ErrorKind kind);

class SchedulerError : public std::runtime_error {
public:
    SchedulerError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad input; raised before anything is mutated.
class ValidationError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

// Referenced card/deck/note does not exist.
class NotFoundError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

class ConflictError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

class DuplicateNoteError : public ConflictError {
public:
    DuplicateNoteError(const std::string& existingNoteId, const std::string& message);

    const std::string& existingNoteId() const { return existing_note_id; }

private:
    std::string existing_note_id;
};

// Store unavailable or a statement/transaction failed. The operation in
// progress has been rolled back when this reaches the caller.
class StorageError : public SchedulerError {
public:
    explicit StorageError(const std::string& message);
};
