/*
 *   ring_buffer.hpp
 * 
 *     Created on: Jun 4, 2025
 * 
 *   This head file defines the class template Utils::RingBuffer<T>,
 *   a fixed-capacity FIFO indexed from the oldest to the newest entry.
 *   Pushing into a full buffer overwrites (discards) the oldest entry.
 */

#pragma once
#ifndef AFQMC_UTILS_RING_BUFFER_HPP
#define AFQMC_UTILS_RING_BUFFER_HPP

#include <vector>
#include <cstddef>
#include <stdexcept>
#include <boost/serialization/access.hpp>
#include <boost/serialization/vector.hpp>

namespace Utils {

    // ----------------------------------------------  Utils::RingBuffer<T>  ---------------------------------------------------
    template <typename T>
    class RingBuffer {
        public:
            using value_type = T;
            using size_type = std::size_t;

            RingBuffer() = default;
            explicit RingBuffer(const size_type capacity) { this->reset(capacity); }

            // --------------------------------------------  Interfaces  -----------------------------------------------------
            size_type capacity() const { return this->m_capacity; }
            size_type size() const { return this->m_size; }
            bool empty() const { return this->m_size == 0; }
            bool full() const { return this->m_capacity > 0 && this->m_size == this->m_capacity; }

            // i = 0 refers to the oldest entry and i = size-1 to the newest one
            T& operator[](const size_type i) { return this->m_data[this->physical_index(i)]; }
            const T& operator[](const size_type i) const { return this->m_data[this->physical_index(i)]; }

            T& at(const size_type i)
            {
                if (i >= this->m_size) {
                    throw std::out_of_range("Utils::RingBuffer<T>::at(): index out of range.");
                }
                return (*this)[i];
            }

            const T& at(const size_type i) const
            {
                if (i >= this->m_size) {
                    throw std::out_of_range("Utils::RingBuffer<T>::at(): index out of range.");
                }
                return (*this)[i];
            }

            T& front() { return this->at(0); }
            const T& front() const { return this->at(0); }
            T& back() { return this->at(this->m_size-1); }
            const T& back() const { return this->at(this->m_size-1); }

            // ------------------------------------------  Modifications  ----------------------------------------------------
            // release the stored entries and set up a new capacity
            void reset(const size_type capacity)
            {
                this->m_data.clear();
                this->m_data.shrink_to_fit();
                this->m_data.resize(capacity);
                this->m_capacity = capacity;
                this->m_head = 0;
                this->m_size = 0;
            }

            // push a new entry at the back, the oldest entry is discarded if the buffer is full.
            // a zero-capacity buffer silently drops everything.
            void push(const T& value)
            {
                if (this->m_capacity == 0) { return; }
                if (this->full()) {
                    this->m_data[this->m_head] = value;
                    this->m_head = (this->m_head + 1) % this->m_capacity;
                }
                else {
                    this->m_data[this->physical_index(this->m_size)] = value;
                    ++this->m_size;
                }
            }

        private:
            friend class boost::serialization::access;

            template <class Archive>
            void serialize(Archive& ar, const unsigned int version)
            {
                ar & this->m_capacity;
                ar & this->m_head;
                ar & this->m_size;
                ar & this->m_data;
            }

            size_type physical_index(const size_type i) const { return (this->m_head + i) % this->m_capacity; }

            size_type m_capacity{0};
            size_type m_head{0};
            size_type m_size{0};
            std::vector<T> m_data{};
    };

} // namespace Utils

#endif // AFQMC_UTILS_RING_BUFFER_HPP
