#pragma once
#include <QDialog>

QT_BEGIN_NAMESPACE
class QDoubleSpinBox;
class QSpinBox;
class QCheckBox;
class QPushButton;
QT_END_NAMESPACE

class CursorControlLoop;
struct CursorConfig;

class SettingsDialog : public QDialog
{
    Q_OBJECT
public:
    explicit SettingsDialog(CursorControlLoop *loop, QWidget *parent = nullptr);

signals:
    void configApplied();

private slots:
    void onApply();
    void onReset();

private:
    CursorControlLoop *loop_;

    QDoubleSpinBox *sensitivitySpin_;
    QDoubleSpinBox *smoothingSpin_;
    QDoubleSpinBox *deadzoneSpin_;
    QDoubleSpinBox *accelerationSpin_;
    QSpinBox *scrollStepSpin_;
    QCheckBox *invertCheck_;

    QPushButton *applyBtn_;
    QPushButton *resetBtn_;

    void loadFrom(const CursorConfig &cfg);
};
