#ifndef __SAMTYPES_HPP__
#define __SAMTYPES_HPP__

#include <cstdint>
#include <memory>
#include <string>

extern "C" {
#include "htslib/sam.h"
#include "htslib/hts.h"
}

using SamFile = samFile;
using SamHeader = bam_hdr_t;
using SamIndex = hts_idx_t;
using SamIterator = hts_itr_t;
using SamRecord = bam1_t;

namespace umiclust {
  namespace samutils {

    struct SamFileCloser {
      void operator()(SamFile* fp) const { if (fp) { sam_close(fp); } }
    };
    struct SamHeaderDeleter {
      void operator()(SamHeader* hdr) const { if (hdr) { bam_hdr_destroy(hdr); } }
    };
    struct SamIndexDeleter {
      void operator()(SamIndex* idx) const { if (idx) { hts_idx_destroy(idx); } }
    };
    struct SamIteratorDeleter {
      void operator()(SamIterator* itr) const { if (itr) { hts_itr_destroy(itr); } }
    };
    struct SamRecordDeleter {
      void operator()(SamRecord* r) const { if (r) { bam_destroy1(r); } }
    };

    using SamFilePtr = std::unique_ptr<SamFile, SamFileCloser>;
    using SamHeaderPtr = std::unique_ptr<SamHeader, SamHeaderDeleter>;
    using SamIndexPtr = std::unique_ptr<SamIndex, SamIndexDeleter>;
    using SamIteratorPtr = std::unique_ptr<SamIterator, SamIteratorDeleter>;
    using SamRecordPtr = std::unique_ptr<SamRecord, SamRecordDeleter>;

    inline SamRecord* bam_init() { return bam_init1(); }

    inline char* bam_name(SamRecord* bam) {
      return bam_get_qname(bam);
    }

    // string (Z) value of an aux tag, empty when the record has none
    inline std::string getStringTag(SamRecord* bam, const char tag[2]) {
      uint8_t* data = bam_aux_get(bam, tag);
      if (data == nullptr) { return std::string(); }
      char* value = bam_aux2Z(data);
      return (value == nullptr) ? std::string() : std::string(value);
    }

    // adds a string (Z) aux tag, replacing any previous value of the tag
    inline int setStringTag(SamRecord* bam, const char tag[2], const std::string& value) {
      uint8_t* existing = bam_aux_get(bam, tag);
      if (existing != nullptr and bam_aux_del(bam, existing) != 0) {
        return -1;
      }
      return bam_aux_append(bam, tag, 'Z', static_cast<int>(value.size() + 1),
                            reinterpret_cast<const uint8_t*>(value.c_str()));
    }

  }
}

#endif // __SAMTYPES_HPP__
