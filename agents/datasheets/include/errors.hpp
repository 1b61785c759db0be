#pragma once
#include <stdexcept>
#include <string>

// Base for every error raised by the datasheet index.
struct DatasheetError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Text to embed was blank after trimming.
struct EmptyInput : DatasheetError {
    using DatasheetError::DatasheetError;
};

// Every entry of a batch embedding request was blank.
struct AllInputsEmpty : DatasheetError {
    using DatasheetError::DatasheetError;
};

// texts and metadata passed to VectorCollection::add differ in length.
struct LengthMismatch : DatasheetError {
    using DatasheetError::DatasheetError;
};

// The text encoder could not be loaded or a runtime encode call failed.
struct EncoderUnavailable : DatasheetError {
    using DatasheetError::DatasheetError;
};

// The collection was created with a different encoder or embedding width.
struct EncoderMismatch : DatasheetError {
    using DatasheetError::DatasheetError;
};

// The persisted collection could not be opened, read or written.
struct StoreUnavailable : DatasheetError {
    using DatasheetError::DatasheetError;
};

// A source document (or manifest) is missing or unreadable.
struct SourceUnreadable : DatasheetError {
    using DatasheetError::DatasheetError;
};
