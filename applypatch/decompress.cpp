/*
 * Copyright (C) 2009 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <limits.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <vector>

#include <android-base/logging.h>
#include <brotli/decode.h>
#include <bzlib.h>
#include <lzma.h>
#include <zstd.h>

#include "applypatch/applypatch.h"

static constexpr size_t kBufferSize = 32768;

CauseCode DecompressStream(uint8_t alg, const uint8_t* data, size_t size,
                           std::vector<uint8_t>* out) {
  switch (alg) {
    case kCompressorNone:
      out->assign(data, data + size);
      return kNoCause;
    case kCompressorBZ2:
      return BZ2Decompress(data, size, out);
    case kCompressorBrotli:
      return BrotliDecompress(data, size, out);
    default:
      LOG(ERROR) << "Unsupported bsdiff stream compressor: " << static_cast<int>(alg);
      return kUnsupportedCodec;
  }
}

CauseCode BZ2Decompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out) {
  out->clear();
  if (size == 0) {
    return kNoCause;
  }

  bz_stream strm = {};
  int ret = BZ2_bzDecompressInit(&strm, 0, 0);
  if (ret != BZ_OK) {
    LOG(ERROR) << "Failed to init bzip2 decompression: " << ret;
    return kDecompressionFailure;
  }

  // avail_in is an unsigned int, so feed inputs larger than UINT_MAX in pieces.
  size_t consumed = 0;
  std::vector<uint8_t> buffer(kBufferSize);
  do {
    if (strm.avail_in == 0 && consumed < size) {
      size_t chunk = std::min<size_t>(size - consumed, UINT_MAX);
      strm.next_in = const_cast<char*>(reinterpret_cast<const char*>(data + consumed));
      strm.avail_in = chunk;
      consumed += chunk;
    }
    strm.next_out = reinterpret_cast<char*>(buffer.data());
    strm.avail_out = buffer.size();

    ret = BZ2_bzDecompress(&strm);
    if (ret != BZ_OK && ret != BZ_STREAM_END) {
      LOG(ERROR) << "Failed to decompress bzip2 data: " << ret;
      break;
    }
    out->insert(out->end(), buffer.data(), buffer.data() + buffer.size() - strm.avail_out);

    if (ret == BZ_OK && strm.avail_in == 0 && consumed == size && strm.avail_out != 0) {
      LOG(ERROR) << "Unexpected end of bzip2 data after " << size << " bytes";
      ret = BZ_UNEXPECTED_EOF;
      break;
    }
  } while (ret != BZ_STREAM_END);

  BZ2_bzDecompressEnd(&strm);
  return ret == BZ_STREAM_END ? kNoCause : kDecompressionFailure;
}

CauseCode BrotliDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out) {
  out->clear();
  if (size == 0) {
    return kNoCause;
  }

  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), BrotliDecoderDestroyInstance);
  if (state == nullptr) {
    LOG(ERROR) << "Failed to create brotli decoder state";
    return kDecompressionFailure;
  }

  size_t available_in = size;
  const uint8_t* next_in = data;
  std::vector<uint8_t> buffer(kBufferSize);
  BrotliDecoderResult result;
  do {
    size_t available_out = buffer.size();
    uint8_t* next_out = buffer.data();
    // The brotli decoder will update |next_in|, |available_in|, |next_out| and |available_out|.
    result = BrotliDecoderDecompressStream(state.get(), &available_in, &next_in, &available_out,
                                           &next_out, nullptr);
    if (result == BROTLI_DECODER_RESULT_ERROR) {
      LOG(ERROR) << "Decompression failed with "
                 << BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get()));
      return kDecompressionFailure;
    }
    out->insert(out->end(), buffer.data(), next_out);

    if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
      LOG(ERROR) << "Unexpected end of brotli data after " << size << " bytes";
      return kDecompressionFailure;
    }
  } while (result != BROTLI_DECODER_RESULT_SUCCESS);

  return kNoCause;
}

CauseCode XZDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out) {
  out->clear();
  if (size == 0) {
    return kNoCause;
  }

  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret ret = lzma_auto_decoder(&strm, UINT64_MAX, 0);
  if (ret != LZMA_OK) {
    LOG(ERROR) << "Failed to init xz decompression: " << ret;
    return kDecompressionFailure;
  }

  strm.next_in = data;
  strm.avail_in = size;
  std::vector<uint8_t> buffer(kBufferSize);
  do {
    strm.next_out = buffer.data();
    strm.avail_out = buffer.size();
    ret = lzma_code(&strm, LZMA_FINISH);
    out->insert(out->end(), buffer.data(), buffer.data() + buffer.size() - strm.avail_out);
  } while (ret == LZMA_OK);
  lzma_end(&strm);

  if (ret != LZMA_STREAM_END) {
    LOG(ERROR) << "Failed to decompress xz data: " << ret;
    return kDecompressionFailure;
  }
  return kNoCause;
}

CauseCode ZstdDecompress(const uint8_t* data, size_t size, std::vector<uint8_t>* out) {
  out->clear();
  if (size == 0) {
    return kNoCause;
  }

  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(ZSTD_createDCtx(), ZSTD_freeDCtx);
  if (dctx == nullptr) {
    LOG(ERROR) << "Failed to create zstd decompression context";
    return kDecompressionFailure;
  }

  ZSTD_inBuffer input = { data, size, 0 };
  std::vector<uint8_t> buffer(kBufferSize);
  size_t ret;
  do {
    ZSTD_outBuffer output = { buffer.data(), buffer.size(), 0 };
    // A return value of 0 means the frame is completely decoded and flushed.
    ret = ZSTD_decompressStream(dctx.get(), &output, &input);
    if (ZSTD_isError(ret)) {
      LOG(ERROR) << "Failed to decompress zstd data: " << ZSTD_getErrorName(ret);
      return kDecompressionFailure;
    }
    out->insert(out->end(), buffer.data(), buffer.data() + output.pos);

    if (ret != 0 && input.pos == input.size && output.pos < output.size) {
      LOG(ERROR) << "Unexpected end of zstd data after " << size << " bytes";
      return kDecompressionFailure;
    }
  } while (ret != 0);

  return kNoCause;
}
