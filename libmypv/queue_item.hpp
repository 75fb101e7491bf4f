#pragma once

#include <memory>
#include <typeinfo>

#include "exceptions.hpp"

namespace mypv {

/**
 * Owns a single message sent to poller thread. Move only,
 * data is released with the item if nobody takes it.
 * Thread-safe if you use classes without references and pointers
 * */
class QueueItem {
    public:
        QueueItem() {}
        QueueItem(QueueItem&&) = default;
        QueueItem& operator=(QueueItem&&) = default;

        template<typename T> static QueueItem create(const T& data) {
            QueueItem ret;
            ret.mHolder.reset(new Holder<T>(data));
            return ret;
        }

        /**
         * Moves data out of the item. Throws if item is empty
         * or holds other type.
         * */
        template<typename T> std::unique_ptr<T> getData() {
            if (mHolder == nullptr)
                throw MyPvProgramException("Tried to get data from empty queue item");
            const std::type_info& destType(typeid(T));
            if (!isSameAs(destType))
                throw MyPvProgramException(std::string("Trying to get ") + destType.name() + " from wrong item");

            std::unique_ptr<T> ret(new T(std::move(static_cast<Holder<T>&>(*mHolder).mData)));
            mHolder.reset();
            return ret;
        }

        bool isSameAs(const std::type_info& type) const {
            return mHolder != nullptr && mHolder->type() == type;
        }

        bool empty() const { return mHolder == nullptr; }

    private:
        class HolderBase {
            public:
                virtual const std::type_info& type() const = 0;
                virtual ~HolderBase() {}
        };

        template<typename T> class Holder : public HolderBase {
            public:
                Holder(const T& data) : mData(data) {}
                virtual const std::type_info& type() const { return typeid(T); }
                T mData;
        };

        std::unique_ptr<HolderBase> mHolder;
};

}
