#include "InterpSegment.h"

SEGMAP_BEGIN

std::string InterpSegment::getInterpName() const { return mSource->readCStringAt(mHeader.mOffset); }

SEGMAP_END
