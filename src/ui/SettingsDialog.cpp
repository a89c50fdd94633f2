#include "SettingsDialog.h"

#include <QCheckBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

#include "../core/CursorControlLoop.h"

SettingsDialog::SettingsDialog(CursorControlLoop *loop, QWidget *parent)
    : QDialog(parent),
      loop_(loop)
{
    setWindowTitle(tr("Cursor Settings"));
    auto *layout = new QVBoxLayout(this);

    layout->addWidget(new QLabel(tr("Motion:"), this));

    auto *hBox1 = new QHBoxLayout();
    sensitivitySpin_ = new QDoubleSpinBox();
    sensitivitySpin_->setRange(0.0, 5.0);
    sensitivitySpin_->setSingleStep(0.05);
    sensitivitySpin_->setDecimals(2);
    smoothingSpin_ = new QDoubleSpinBox();
    smoothingSpin_->setRange(0.0, 0.99);
    smoothingSpin_->setSingleStep(0.05);
    smoothingSpin_->setDecimals(2);
    deadzoneSpin_ = new QDoubleSpinBox();
    deadzoneSpin_->setRange(0.0, 50.0);
    deadzoneSpin_->setDecimals(1);
    deadzoneSpin_->setSuffix(tr(" px"));

    hBox1->addWidget(new QLabel(tr("sensitivity:")));
    hBox1->addWidget(sensitivitySpin_);
    hBox1->addWidget(new QLabel(tr("smoothing:")));
    hBox1->addWidget(smoothingSpin_);
    hBox1->addWidget(new QLabel(tr("deadzone:")));
    hBox1->addWidget(deadzoneSpin_);
    layout->addLayout(hBox1);

    auto *hBox2 = new QHBoxLayout();
    accelerationSpin_ = new QDoubleSpinBox();
    accelerationSpin_->setRange(1.0, 3.0);
    accelerationSpin_->setSingleStep(0.1);
    accelerationSpin_->setDecimals(2);
    scrollStepSpin_ = new QSpinBox();
    scrollStepSpin_->setRange(1, 1200);
    invertCheck_ = new QCheckBox(tr("Invert"), this);

    hBox2->addWidget(new QLabel(tr("acceleration:")));
    hBox2->addWidget(accelerationSpin_);
    hBox2->addWidget(invertCheck_);
    hBox2->addWidget(new QLabel(tr("scroll step:")));
    hBox2->addWidget(scrollStepSpin_);
    layout->addLayout(hBox2);

    // buttons
    auto *btnBox = new QHBoxLayout();
    applyBtn_ = new QPushButton(tr("Apply"));
    resetBtn_ = new QPushButton(tr("Reset"));
    btnBox->addStretch();
    btnBox->addWidget(resetBtn_);
    btnBox->addWidget(applyBtn_);
    layout->addLayout(btnBox);

    connect(applyBtn_, &QPushButton::clicked, this, &SettingsDialog::onApply);
    connect(resetBtn_, &QPushButton::clicked, this, &SettingsDialog::onReset);

    loadFrom(*loop_->config());
}

void SettingsDialog::loadFrom(const CursorConfig &cfg)
{
    sensitivitySpin_->setValue(cfg.sensitivity);
    smoothingSpin_->setValue(cfg.smoothing);
    deadzoneSpin_->setValue(cfg.deadzone);
    accelerationSpin_->setValue(cfg.acceleration);
    scrollStepSpin_->setValue(cfg.scrollStep);
    invertCheck_->setChecked(cfg.invert);
}

void SettingsDialog::onApply()
{
    CursorConfig cfg = *loop_->config();
    cfg.sensitivity = sensitivitySpin_->value();
    cfg.smoothing = smoothingSpin_->value();
    cfg.deadzone = deadzoneSpin_->value();
    cfg.acceleration = accelerationSpin_->value();
    cfg.scrollStep = scrollStepSpin_->value();
    cfg.invert = invertCheck_->isChecked();

    QString error;
    if (!loop_->setConfig(cfg, &error))
    {
        QMessageBox::warning(this, tr("Invalid settings"), error);
        return;
    }

    emit configApplied();
    accept();
}

void SettingsDialog::onReset()
{
    // Gesture bindings are edited in the main window; only motion resets here.
    loadFrom(CursorConfig());
}
