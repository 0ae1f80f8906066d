#include "transfer_error.hpp"

const char* to_string(TransferStage stage) {
  switch(stage) {
    case TransferStage::CacheCheck: return "cache-check";
    case TransferStage::Packing: return "packing";
    case TransferStage::Fetching: return "fetching";
    case TransferStage::Assembling: return "assembling";
    case TransferStage::Verifying: return "verifying";
    case TransferStage::Extracting: return "extracting";
    case TransferStage::Done: return "done";
  }
  return "unknown";
}

const char* to_string(TransferErrorKind kind) {
  switch(kind) {
    case TransferErrorKind::SourceNotFound: return "SourceNotFound";
    case TransferErrorKind::PackFailed: return "PackFailed";
    case TransferErrorKind::SizeQueryFailed: return "SizeQueryFailed";
    case TransferErrorKind::ChunkFetchExhausted: return "ChunkFetchExhausted";
    case TransferErrorKind::OverlapMismatch: return "OverlapMismatch";
    case TransferErrorKind::SizeMismatch: return "SizeMismatch";
    case TransferErrorKind::ChecksumMismatch: return "ChecksumMismatch";
    case TransferErrorKind::ExtractionFailed: return "ExtractionFailed";
    case TransferErrorKind::LocalIoFailed: return "LocalIoFailed";
  }
  return "Unknown";
}

TransferError::TransferError(TransferErrorKind kind,
                             TransferStage stage,
                             const std::string& message)
  : std::runtime_error(message),
    kind_(kind),
    stage_(stage) {}
