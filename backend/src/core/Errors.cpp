#include "Errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidRating: return "InvalidRating";
    case ErrorKind::InvalidDeckConfig: return "InvalidDeckConfig";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    case ErrorKind::CardSuspended: return "CardSuspended";
    case ErrorKind::UnknownCard: return "UnknownCard";
    case ErrorKind::UnknownDeck: return "UnknownDeck";
    case ErrorKind::UnknownNote: return "UnknownNote";
    case ErrorKind::DuplicateNote: return "DuplicateNote";
    case ErrorKind::DuplicateDeck: return "DuplicateDeck";
    case ErrorKind::Storage: return "Storage";
    }
    return "Unknown";
}

SchedulerError::SchedulerError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
{
}

DuplicateNoteError::DuplicateNoteError(const std::string& existingNoteId, const std::string& message)
    : ConflictError(ErrorKind::DuplicateNote, message), existing_note_id(existingNoteId)
{
}

StorageError::StorageError(const std::string& message)
    : SchedulerError(ErrorKind::Storage, message)
{
}
