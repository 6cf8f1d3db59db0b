//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Intrusive singly-linked lists for global registries.
//!
//!\details
//! Log handlers, polled objects and timers register themselves on global
//! lists at construction, so no registry ever allocates memory.  Each
//! listed class declares `netboot::util::ListCore` a friend and holds a
//! private `m_next` pointer that only ListCore touches.  An object must
//! unlink itself before it is destroyed.

#pragma once

namespace netboot {
    namespace util {
        //! Static list operations, grouped so one friend line covers all.
        class ListCore {
        public:
            //! Push an item onto the head of the list.
            template <class T> static inline
            void add(T*& head, T* item) {
                item->m_next = head;
                head = item;
            }

            //! Number of items in the list.
            template <class T> static inline
            unsigned len(const T* head) {
                unsigned n = 0;
                while (head) {++n; head = head->m_next;}
                return n;
            }

            //! Item following the given one, or null at the end.
            template <class T> static inline
            T* next(const T* item) {
                return item->m_next;
            }

            //! Unlink an item.  Items not in the list are left unchanged.
            template <class T> static inline
            void remove(T*& head, T* item) {
                for (T** link = &head ; *link ; link = &(*link)->m_next) {
                    if (*link == item) {
                        *link = item->m_next;
                        break;
                    }
                }
                item->m_next = 0;
            }

            //! Unit tests only: force the list to hold just "item" (or
            //! nothing, if null).  Returns true if no change was needed.
            template <class T> static inline
            bool pre_test_reset(T*& head, T* item) {
                bool clean = (head == item) && (!head || !head->m_next);
                head = item;
                if (item) item->m_next = 0;
                return clean;
            }
        };
    }
}
