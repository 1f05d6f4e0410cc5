#include "ResizeStormGuard.hpp"

namespace pv {
ResizeStormGuard::ResizeStormGuard(const string& _terminalId,
                                   const string& _pattern, int _threshold,
                                   size_t _windowSize)
    : terminalId(_terminalId),
      pattern(_pattern),
      threshold(_threshold),
      windowSize(_windowSize),
      rapidCount(0),
      suppressing(false),
      blockedCount(0),
      episodeCount(0) {
  if (windowSize < 2) {
    throw std::runtime_error("Resize storm window is too small");
  }
}

int ResizeStormGuard::countOccurrences(const string& haystack,
                                       const string& needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  size_t pos = haystack.find(needle);
  while (pos != string::npos) {
    count++;
    pos = haystack.find(needle, pos + needle.length());
  }
  return count;
}

void ResizeStormGuard::block(const string& reason) {
  blockedCount++;
  if (!suppressing) {
    suppressing = true;
    episodeCount++;
    LOG(ERROR) << "CRITICAL: Blocking resize loop on terminal " << terminalId
               << " - " << reason;
  } else {
    VLOG(1) << "Still blocking resize loop on terminal " << terminalId << " - "
            << reason;
  }
}

bool ResizeStormGuard::allow(const string& data, TimePoint now) {
  if (pattern.empty()) {
    return true;
  }

  window += data;
  if (window.length() > windowSize) {
    window = window.substr(window.length() - windowSize / 2);
  }

  bool isStormChunk = data.length() < MAX_MATCH_LENGTH &&
                      data.find(pattern) != string::npos;
  if (isStormChunk) {
    int windowCount = countOccurrences(window, pattern);
    if (windowCount > threshold) {
      block(to_string(windowCount) + " resize sequences in recent output");
      window.clear();
      return false;
    }

    if (lastMatchTime &&
        now - *lastMatchTime < std::chrono::milliseconds(RAPID_WINDOW_MS)) {
      rapidCount++;
    } else {
      rapidCount = 1;
    }
    lastMatchTime = now;
    if (rapidCount > threshold) {
      block(to_string(rapidCount) + " rapid resize sequences");
      return false;
    }
    return true;
  }

  string trimmed = data;
  trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
  trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
  if (trimmed.length() > SUBSTANTIAL_LENGTH &&
      data.find("\x1b[") == string::npos) {
    rapidCount = 0;
  }
  if (suppressing) {
    VLOG(1) << "Resize loop on terminal " << terminalId << " ended after "
            << blockedCount << " blocked chunks";
    suppressing = false;
  }
  return true;
}
}  // namespace pv
