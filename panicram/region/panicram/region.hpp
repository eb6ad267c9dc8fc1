/**
 * @file region.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Bounds-checked access to the persistent record region.
 *
 * The region is a fixed span of RAM that survives a watchdog reset. Its
 * address bounds come from the platform (linker symbols or a buffer in
 * `.uninitialized_data`). This module is the only place where those raw
 * addresses are turned into something the rest of the library can use:
 * every other component operates on a ByteView and never on raw pointers
 * derived from the platform.
 */

#pragma once

#include <cstddef>
#include <cstdint>


namespace PanicRam {

    /**
     * @brief Non-owning, bounds-checked view over a span of mutable bytes
     *
     * A ByteView never points outside the span it was created from. Every
     * derived view produced by subview() is clamped to the parent's bounds,
     * so a corrupted length read back from memory can shorten a view but can
     * never make it reach past the end of the region.
     */
    class ByteView {
    public:
        static constexpr size_t npos = static_cast<size_t>(-1);

        ByteView() : _data(nullptr), _size(0) {}

        ByteView(uint8_t *data, size_t size) : _data(data), _size(data != nullptr ? size : 0) {}

        uint8_t *data() const { return _data; }

        size_t size() const { return _size; }

        bool empty() const { return _size == 0; }

        /**
         * @brief Derive a view over part of this view
         *
         * @param offset First byte of the derived view, relative to this view
         * @param length Requested length; clamped to the bytes available
         * @return The clamped view; empty if offset is past the end
         */
        ByteView subview(size_t offset, size_t length = npos) const;

        /**
         * @brief Fill every byte of the view with a value
         *
         * @param value Byte value to write
         */
        void fill(uint8_t value) const;

        uint8_t &operator[](size_t index) const { return _data[index]; }

    private:
        uint8_t *_data;
        size_t _size;
    };

} // namespace PanicRam


namespace PanicRam::Region {

    /**
     * @brief Resolve the persistent record region into a byte view
     *
     * Re-derives the view from PanicRam::Platform::regionBounds() on every
     * call; no handle is cached. An inverted or null range yields an empty
     * view.
     *
     * @return Mutable view over [start, end)
     *
     * @note The region must be at least as large as the record header. This
     *       is a deployment contract and is not checked here.
     */
    ByteView region();

    /**
     * @brief Check the deployment contract on the region size
     *
     * Logs an error if the region cannot hold a record header. Intended to be
     * called once at boot, never from the fault path.
     *
     * @return true if the region is large enough to hold a record header
     */
    bool verifyRegion();

} // namespace PanicRam::Region
