#pragma once

#include "ports/input/IReceiptService.hpp"
#include "ports/output/IRecordRepository.hpp"
#include "ports/output/IReceiptFileStore.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <iostream>

namespace emulator::application {

class ReceiptService : public ports::input::IReceiptService {
public:
    ReceiptService(
        std::shared_ptr<ports::output::IRecordRepository<domain::Receipt>> receipts,
        std::shared_ptr<ports::output::IReceiptFileStore> files,
        std::shared_ptr<ports::output::IUnitOfWork> unitOfWork
    ) : receipts_(std::move(receipts))
      , files_(std::move(files))
      , unitOfWork_(std::move(unitOfWork))
    {
        std::cout << "[ReceiptService] Created" << std::endl;
    }

    domain::Receipt create(const domain::ReceiptUpload& upload) override {
        std::string temporaryPath = files_->writeTemporary(upload.companyId, upload.content);

        domain::Receipt receipt;
        receipt.companyId = upload.companyId;
        receipt.issueDate = upload.issueDate;
        receipt.description = upload.description;
        receipt.status = "unconfirmed";
        receipt.fileName = upload.fileName;
        receipt.createdAt = domain::Timestamp::now();
        receipt.updatedAt = receipt.createdAt;

        try {
            unitOfWork_->execute([&]() {
                receipt.id = receipts_->nextId();
                receipts_->save(receipt);
            });
        } catch (const std::exception& e) {
            std::cerr << "[ReceiptService] Failed to create record: " << e.what() << std::endl;
            files_->remove(temporaryPath);
            throw;
        }

        try {
            receipt.filePath = files_->promote(temporaryPath, receipt.companyId, receipt.id);
            receipt.updatedAt = domain::Timestamp::now();
            receipts_->save(receipt);
        } catch (const std::exception& e) {
            std::cerr << "[ReceiptService] Failed to store file for receipt " << receipt.id
                      << ": " << e.what() << std::endl;
            files_->remove(temporaryPath);
            files_->remove(receipt.filePath);
            receipts_->deleteById(receipt.id);
            throw;
        }

        std::cout << "[ReceiptService] Created receipt " << receipt.id << " -> " << receipt.filePath << std::endl;
        return receipt;
    }

    std::optional<domain::Receipt> getById(std::int64_t id) override {
        return receipts_->findById(id);
    }

    std::vector<domain::Receipt> list(std::optional<std::int64_t> companyId) override {
        return receipts_->findAll([companyId](const domain::Receipt& receipt) {
            return !companyId || receipt.companyId == *companyId;
        });
    }

    bool remove(std::int64_t id) override {
        auto receipt = receipts_->findById(id);
        if (!receipt) {
            return false;
        }

        if (!files_->remove(receipt->filePath)) {
            std::cout << "[ReceiptService] File for receipt " << id << " was not removed: "
                      << receipt->filePath << std::endl;
        }
        return receipts_->deleteById(id);
    }

private:
    std::shared_ptr<ports::output::IRecordRepository<domain::Receipt>> receipts_;
    std::shared_ptr<ports::output::IReceiptFileStore> files_;
    std::shared_ptr<ports::output::IUnitOfWork> unitOfWork_;
};

} // namespace emulator::application
