/**
 * @file region.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "panicram/region.hpp"

#include <cstring>

#include "panicram/log.hpp"
#include "panicram/platform.hpp"
#include "panicram/record.hpp"


namespace PanicRam {

    ByteView ByteView::subview(size_t offset, size_t length) const {
        if (offset >= _size) {
            return ByteView(_data != nullptr ? _data + _size : nullptr, 0);
        }

        size_t available = _size - offset;
        return ByteView(_data + offset, length < available ? length : available);
    }

    void ByteView::fill(uint8_t value) const {
        if (_data != nullptr && _size > 0) {
            memset(_data, value, _size);
        }
    }

} // namespace PanicRam


namespace PanicRam::Region {

    ByteView region() {
        Platform::RegionBounds bounds = Platform::regionBounds();

        if (bounds.start == nullptr || bounds.end <= bounds.start) {
            return ByteView();
        }

        return ByteView(bounds.start, static_cast<size_t>(bounds.end - bounds.start));
    }

    bool verifyRegion() {
        ByteView view = region();

        if (view.size() < HEADER_SIZE) {
            LOGE("Persistent region is %u bytes, smaller than the %u byte record header\n",
                 static_cast<unsigned>(view.size()), static_cast<unsigned>(HEADER_SIZE));
            return false;
        }

        LOGD("Persistent region at %p, %u bytes\n",
             static_cast<void *>(view.data()), static_cast<unsigned>(view.size()));
        return true;
    }

} // namespace PanicRam::Region
