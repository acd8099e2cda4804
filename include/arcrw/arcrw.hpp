#pragma once

// 对外总头文件
//
//   auto grid = arcrw::UniqueArcSliceRwLock<double>::Filled(arcrw::GlobalAllocator{}, n, 0.0);
//   auto it   = std::move(grid).IterMut();
//   while (auto cell = it.Next()) { ... 各线程 (*cell)->Write() ... }

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcMappedRwLock.hpp"
#include "arcrw/Arc/UniqueArcMappedRwLock.hpp"
#include "arcrw/Lock/LockConfig.hpp"
#include "arcrw/Lock/LockResult.hpp"
#include "arcrw/Lock/MappedRwLock.hpp"
#include "arcrw/Lock/SliceRef.hpp"
#include "arcrw/Slice/SliceIter.hpp"
#include "arcrw/Slice/SliceIterMut.hpp"
#include "arcrw/Util/Log.hpp"
