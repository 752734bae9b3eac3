/*
    Copyright (c) 2015 Evgeny Safronov <division494@gmail.com>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.
    This file is part of ShapeShift.
    ShapeShift is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.
    ShapeShift is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.
    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#include "shapeshift/buffer.hpp"

#include <algorithm>
#include <cstring>

using namespace shapeshift;

output_buffer_t::output_buffer_t() :
    head_(0),
    tail_(0)
{}

output_buffer_t::output_buffer_t(std::size_t capacity) :
    storage_(capacity),
    head_(0),
    tail_(0)
{}

char*
output_buffer_t::prepare(std::size_t size) {
    if (storage_.size() - tail_ >= size) {
        return storage_.data() + tail_;
    }

    // Reclaim the flushed head first, grow only when it is not enough.
    if (head_ > 0) {
        const std::size_t content = tail_ - head_;
        std::memmove(storage_.data(), storage_.data() + head_, content);
        head_ = 0;
        tail_ = content;
    }

    if (storage_.size() - tail_ < size) {
        storage_.resize(std::max(storage_.size() * 2, tail_ + size));
    }

    return storage_.data() + tail_;
}

void
output_buffer_t::commit(std::size_t size) {
    tail_ = std::min(tail_ + size, storage_.size());
}

void
output_buffer_t::consume(std::size_t size) {
    head_ = std::min(head_ + size, tail_);

    if (head_ == tail_) {
        head_ = 0;
        tail_ = 0;
    }
}

void
output_buffer_t::clear() {
    head_ = 0;
    tail_ = 0;
}
