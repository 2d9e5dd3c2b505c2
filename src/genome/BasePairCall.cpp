#include "genome/BasePairCall.h"

const char* refStatusName(RefStatus status) {
    switch (status) {
        case RefStatus::HomRef: return "hom_ref";
        case RefStatus::HetMix: return "het_mix";
        case RefStatus::HomAlt: return "hom_alt";
        case RefStatus::HetAlt: return "het_alt";
    }
    return "unknown";
}
