/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

namespace segalloc {

class heap_local;

// Called by constructor and destructor of every heap.
void register_heap(heap_local *heap) noexcept;
void unregister_heap(heap_local *heap) noexcept;

// Returns heap of the calling thread or nullptr if it was not created yet.
heap_local * existing_heap() noexcept;

} // namespace segalloc
