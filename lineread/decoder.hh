#ifndef LINEREAD_DECODER__
#define LINEREAD_DECODER__

#include "lineread/config.hh"

#include <unicode/ucnv.h>

#include <cstddef>
#include <string>

#include <stdint.h>

namespace lineread {

/* Incremental conversion from any ICU-supported encoding to UTF-8.
 *
 * The converter keeps its state between calls to Decode, so a multi-byte
 * sequence that straddles two chunks is held inside the converter until the
 * rest of it arrives.  Chunks are therefore never decoded in isolation and
 * the output does not depend on where the chunk boundaries fall.
 */
class Decoder {
  public:
    // Throws ConfigurationException if ICU doesn't know the encoding.
    Decoder(const std::string &encoding, DecodeErrorPolicy policy);

    ~Decoder();

    /* Append the UTF-8 for size bytes at data to out.  Pass flush on the
     * final call (size may be 0) so that an incomplete sequence left at the
     * end of the stream is reported or substituted per the policy.
     * Under kStrict, malformed input throws DecodeException.
     */
    void Decode(const char *data, std::size_t size, bool flush, std::string &out);

    const std::string &Encoding() const { return encoding_; }

    // Input bytes passed to Decode so far.
    uint64_t Consumed() const { return consumed_; }

  private:
    void ThrowDecodeError(UErrorCode err, uint64_t offset);

    const std::string encoding_;

    UConverter *source_;
    UConverter *utf8_;

    // UTF-16 between the two converters.  Survives between calls.
    static const std::size_t kPivotSize = 1024;
    UChar pivot_[kPivotSize];
    UChar *pivot_source_, *pivot_target_;

    uint64_t consumed_;

    Decoder(const Decoder &);
    Decoder &operator=(const Decoder &);
};

} // namespace lineread

#endif // LINEREAD_DECODER__
