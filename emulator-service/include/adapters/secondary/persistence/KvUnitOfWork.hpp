// include/adapters/secondary/persistence/KvUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include <memory>

namespace emulator::adapters::secondary::persistence
{

    class KvUnitOfWork : public ports::output::IUnitOfWork
    {
    public:
        explicit KvUnitOfWork(std::shared_ptr<ports::output::IKeyValueStore> store)
            : store_(std::move(store)) {}

        void execute(const std::function<void()> &work) override
        {
            store_->transaction(work);
        }

    private:
        std::shared_ptr<ports::output::IKeyValueStore> store_;
    };

} // namespace emulator::adapters::secondary::persistence
