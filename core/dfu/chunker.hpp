#pragma once

#include <algorithm>
#include "base_types.hpp"
#include "error.hpp"

// Lazy view of a buffer as consecutive frames of at most max_frame_size bytes.
// The buffer must outlive the Chunker and any iterator taken from it.
class Chunker {
private:
	const ByteArray& m_data;
	unsigned int m_frame_size;

public:
	class iterator {
	private:
		const ByteArray *m_data;
		unsigned int m_offset;
		unsigned int m_frame_size;

	public:
		iterator(const ByteArray *data, unsigned int offset, unsigned int frame_size) :
			m_data(data), m_offset(offset), m_frame_size(frame_size) {}

		ByteSlice operator*() const {
			unsigned int length = std::min<unsigned int>(m_frame_size, m_data->size() - m_offset);
			return ByteSlice { m_data->data() + m_offset, length };
		}
		iterator& operator++() {
			m_offset = std::min<unsigned int>(m_offset + m_frame_size, m_data->size());
			return *this;
		}
		bool operator==(const iterator& other) const {
			return m_data == other.m_data && m_offset == other.m_offset;
		}
		bool operator!=(const iterator& other) const {
			return !(*this == other);
		}
		unsigned int offset() const {
			return m_offset;
		}
	};

	Chunker(const ByteArray& data, unsigned int max_frame_size) : m_data(data), m_frame_size(max_frame_size) {
		if (max_frame_size == 0)
			throw ErrorCode::DFU_INVALID_FRAME_SIZE;
	}

	iterator begin() const {
		return iterator(&m_data, 0, m_frame_size);
	}
	iterator end() const {
		return iterator(&m_data, m_data.size(), m_frame_size);
	}
	unsigned int num_chunks() const {
		return (m_data.size() + m_frame_size - 1) / m_frame_size;
	}
	unsigned int frame_size() const {
		return m_frame_size;
	}
};
