// include/ports/output/IUnitOfWork.hpp
#pragma once

#include <functional>

namespace emulator::ports::output
{

    /**
     * @brief Граница транзакции хранилища для сценариев из нескольких операций
     */
    class IUnitOfWork
    {
    public:
        virtual ~IUnitOfWork() = default;

        /**
         * @brief Выполняет work атомарно. Исключение откатывает изменения.
         */
        virtual void execute(const std::function<void()> &work) = 0;
    };

} // namespace emulator::ports::output
