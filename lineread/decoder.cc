#include "lineread/decoder.hh"

#include "lineread/exception.hh"

#include <unicode/ucnv_err.h>
#include <unicode/utypes.h>

#include <iomanip>
#include <new>
#include <sstream>

namespace lineread {

namespace {

UConverter *OpenConverter(const std::string &name) {
  UErrorCode err = U_ZERO_ERROR;
  UConverter *ret = ucnv_open(name.c_str(), &err);
  LINEREAD_THROW_IF(U_FAILURE(err) || !ret, ConfigurationException, "ICU does not know the encoding " << name << " (" << u_errorName(err) << ").");
  return ret;
}

UConverterToUCallback PolicyCallback(DecodeErrorPolicy policy) {
  switch (policy) {
    case kStrict:
      return UCNV_TO_U_CALLBACK_STOP;
    case kIgnore:
      return UCNV_TO_U_CALLBACK_SKIP;
    case kReplace:
      break;
  }
  return UCNV_TO_U_CALLBACK_SUBSTITUTE;
}

} // namespace

Decoder::Decoder(const std::string &encoding, DecodeErrorPolicy policy)
  : encoding_(encoding), source_(NULL), utf8_(NULL), pivot_source_(pivot_), pivot_target_(pivot_), consumed_(0) {
  // ICU would hand back the platform default converter for an empty name.
  LINEREAD_THROW_IF(encoding.empty(), ConfigurationException, "An encoding name is required.");
  source_ = OpenConverter(encoding);
  try {
    utf8_ = OpenConverter("UTF-8");
    UErrorCode err = U_ZERO_ERROR;
    // A NULL context applies the action to every kind of bad input.
    ucnv_setToUCallBack(source_, PolicyCallback(policy), NULL, NULL, NULL, &err);
    LINEREAD_THROW_IF(U_FAILURE(err), ConfigurationException, "Could not set the " << DecodeErrorPolicyName(policy) << " policy for " << encoding << " (" << u_errorName(err) << ").");
  } catch (...) {
    if (utf8_) ucnv_close(utf8_);
    ucnv_close(source_);
    throw;
  }
}

Decoder::~Decoder() {
  ucnv_close(utf8_);
  ucnv_close(source_);
}

void Decoder::Decode(const char *data, std::size_t size, bool flush, std::string &out) {
  // ICU rejects a NULL source even when there is nothing to read.
  static const char kNothing = 0;
  if (!data) data = &kNothing;
  const char *source = data;
  const char *const source_limit = data + size;
  std::size_t written = out.size();
  while (true) {
    // Enough for UTF-8 and single byte input in one pass.  Others loop.
    std::size_t room = static_cast<std::size_t>(source_limit - source) + 3 * kPivotSize;
    out.resize(written + room);
    char *const target_begin = &out[written];
    char *target = target_begin;
    UErrorCode err = U_ZERO_ERROR;
    ucnv_convertEx(utf8_, source_,
        &target, target_begin + room,
        &source, source_limit,
        pivot_, &pivot_source_, &pivot_target_, pivot_ + kPivotSize,
        false, flush, &err);
    written += target - target_begin;
    if (err == U_BUFFER_OVERFLOW_ERROR) continue;
    if (U_FAILURE(err)) {
      out.resize(written);
      ThrowDecodeError(err, consumed_ + (source - data));
    }
    break;
  }
  out.resize(written);
  consumed_ += size;
}

void Decoder::ThrowDecodeError(UErrorCode err, uint64_t offset) {
  if (err == U_MEMORY_ALLOCATION_ERROR) throw std::bad_alloc();
  char bad[32];
  int8_t length = sizeof(bad);
  UErrorCode ignored = U_ZERO_ERROR;
  ucnv_getInvalidChars(source_, bad, &length, &ignored);
  if (U_FAILURE(ignored)) length = 0;
  // ICU stops just past the offending bytes.
  offset = (offset >= static_cast<uint64_t>(length)) ? offset - length : 0;
  std::ostringstream hex;
  for (int8_t i = 0; i < length; ++i) {
    hex << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned int>(static_cast<unsigned char>(bad[i]));
  }
  LINEREAD_THROW_ARG(DecodeException, (offset), "Can't decode bytes " << hex.str() << " as " << encoding_ << " at byte " << offset << " (" << u_errorName(err) << ").");
}

} // namespace lineread
