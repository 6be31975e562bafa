#include "RecentVideosDialog.hpp"

#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QVBoxLayout>

RecentVideosDialog::RecentVideosDialog(QWidget *parent)
    : QDialog(parent), m_model(new RecentVideosModel(this)),
      m_view(new QTableView(this)), m_openButton(new QPushButton("Open")),
      m_removeButton(new QPushButton("Remove")),
      m_closeButton(new QPushButton("Close"))
{
    setWindowTitle("Recent Videos");
    setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint);
    setMinimumSize(560, 320);

    m_view->setModel(m_model);
    m_view->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_view->setSelectionMode(QAbstractItemView::SingleSelection);
    m_view->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_view->verticalHeader()->setVisible(false);
    m_view->horizontalHeader()->setStretchLastSection(true);
    m_view->horizontalHeader()->setSectionResizeMode(
        RecentVideosModel::Location, QHeaderView::Stretch);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    buttonLayout->addWidget(m_openButton);
    buttonLayout->addWidget(m_removeButton);
    buttonLayout->addStretch();
    buttonLayout->addWidget(m_closeButton);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(m_view);
    layout->addLayout(buttonLayout);
    setLayout(layout);

    connect(m_view->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, [this]() { updateButtons(); });
    connect(m_model, &QAbstractItemModel::modelReset, this,
            [this]() { updateButtons(); });

    connect(m_view, &QTableView::activated, this,
            [this](const QModelIndex &index)
    { emit openRequested(m_model->entryAt(index.row()).id()); });

    connect(m_openButton, &QPushButton::clicked, this, [this]()
    {
        const int row = selectedRow();
        if (row >= 0)
            emit openRequested(m_model->entryAt(row).id());
    });

    connect(m_removeButton, &QPushButton::clicked, this, [this]()
    {
        const int row = selectedRow();
        if (row >= 0)
            emit removeRequested(row);
    });

    connect(m_closeButton, &QPushButton::clicked, this, &QDialog::accept);

    updateButtons();
}

void
RecentVideosDialog::setEntries(RecentList entries) noexcept
{
    m_model->setEntries(std::move(entries));
    m_view->resizeColumnToContents(RecentVideosModel::Name);
}

int
RecentVideosDialog::selectedRow() const noexcept
{
    const QModelIndexList rows = m_view->selectionModel()->selectedRows();
    if (rows.isEmpty())
        return -1;
    return rows.first().row();
}

void
RecentVideosDialog::updateButtons() noexcept
{
    const bool hasSelection = selectedRow() >= 0;
    m_openButton->setEnabled(hasSelection);
    m_removeButton->setEnabled(hasSelection);
}
